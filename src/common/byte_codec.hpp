#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <optional>

namespace nd::codec {

constexpr int kDumpBytesPerLine = 16;

enum class Encoding {
    Ascii = 0,
    Hex,
    Binary,  // base64 text decoded to raw bytes
};

enum class FormatError {
    None = 0,
    OddLength,
    InvalidHexDigit,
    InvalidBase64,
};

QString encoding_name(Encoding encoding);
std::optional<Encoding> encoding_from_name(const QString &name);

// Converts a textual transaction payload into the bytes put on the wire.
std::optional<QByteArray> encode(const QString &text, Encoding encoding,
                                 FormatError *error = nullptr, QString *message = nullptr);

// Whitespace and '-' separators are ignored; the remaining digits must pair up.
std::optional<QByteArray> hex_to_bytes(const QString &hex, FormatError *error = nullptr, QString *message = nullptr);

std::optional<QByteArray> base64_to_bytes(const QString &text, FormatError *error = nullptr, QString *message = nullptr);

// 16 bytes per line: "%08x  " offset, hex pairs with an extra gap after the
// 8th byte, then "|ascii|". Lines are joined by '\n' without a trailing one.
QString hex_dump(const QByteArray &data, int offset, int count);
QString hex_dump(const QByteArray &data);

// "de ad be ef"
QString to_hex_string(const QByteArray &data, int offset = 0, int count = -1);

// Single-line ASCII rendering with CR/LF spelled out as \r and \n.
QString ascii_preview(const QByteArray &data);

}  // namespace nd::codec
