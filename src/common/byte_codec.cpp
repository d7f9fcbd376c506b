#include "byte_codec.hpp"

#include <algorithm>
#include <cstdint>

namespace nd::codec {

namespace {

void set_error(FormatError code, const QString &reason, FormatError *outCode, QString *outReason) {
    if (outCode) {
        *outCode = code;
    }
    if (outReason) {
        *outReason = reason;
    }
}

bool is_hex_digit(QChar ch) {
    const ushort u = ch.unicode();
    return (u >= '0' && u <= '9') || (u >= 'a' && u <= 'f') || (u >= 'A' && u <= 'F');
}

// Anything outside 7-bit ASCII becomes '?', one per code point.
QByteArray ascii_bytes(const QString &text) {
    QByteArray out;
    out.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch.unicode() < 0x80) {
            out.append(static_cast<char>(ch.unicode()));
            continue;
        }
        out.append('?');
        if (ch.isHighSurrogate() && i + 1 < text.size() && text.at(i + 1).isLowSurrogate()) {
            ++i;
        }
    }
    return out;
}

bool is_printable(uint8_t byte) {
    return byte >= 0x20 && byte < 0x7f;
}

}  // namespace

QString encoding_name(Encoding encoding) {
    switch (encoding) {
    case Encoding::Ascii:
        return QStringLiteral("Ascii");
    case Encoding::Hex:
        return QStringLiteral("Hex");
    case Encoding::Binary:
        return QStringLiteral("Binary");
    }
    return QStringLiteral("Ascii");
}

std::optional<Encoding> encoding_from_name(const QString &name) {
    const QString key = name.trimmed();
    for (const auto candidate : {Encoding::Ascii, Encoding::Hex, Encoding::Binary}) {
        if (key.compare(encoding_name(candidate), Qt::CaseInsensitive) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<QByteArray> encode(const QString &text, Encoding encoding, FormatError *error, QString *message) {
    set_error(FormatError::None, QString(), error, message);
    switch (encoding) {
    case Encoding::Ascii:
        return ascii_bytes(text);
    case Encoding::Hex:
        return hex_to_bytes(text, error, message);
    case Encoding::Binary:
        return base64_to_bytes(text, error, message);
    }
    return ascii_bytes(text);
}

std::optional<QByteArray> hex_to_bytes(const QString &hex, FormatError *error, QString *message) {
    set_error(FormatError::None, QString(), error, message);

    QByteArray digits;
    digits.reserve(hex.size());
    for (const QChar ch : hex) {
        if (ch.isSpace() || ch == QLatin1Char('-')) {
            continue;
        }
        if (!is_hex_digit(ch)) {
            set_error(FormatError::InvalidHexDigit,
                      QStringLiteral("Invalid hex character '%1'.").arg(ch), error, message);
            return std::nullopt;
        }
        digits.append(static_cast<char>(ch.unicode()));
    }
    if (digits.size() % 2 != 0) {
        set_error(FormatError::OddLength, QStringLiteral("Hex string must have an even length."), error, message);
        return std::nullopt;
    }
    return QByteArray::fromHex(digits);
}

std::optional<QByteArray> base64_to_bytes(const QString &text, FormatError *error, QString *message) {
    set_error(FormatError::None, QString(), error, message);

    QByteArray compact;
    compact.reserve(text.size());
    for (const QChar ch : text) {
        if (!ch.isSpace()) {
            compact.append(ch.toLatin1());
        }
    }
    if (compact.size() % 4 != 0) {
        set_error(FormatError::InvalidBase64,
                  QStringLiteral("Base64 input length %1 is not a multiple of 4.").arg(compact.size()), error, message);
        return std::nullopt;
    }
    const auto result = QByteArray::fromBase64Encoding(compact, QByteArray::AbortOnBase64DecodingErrors);
    if (result.decodingStatus != QByteArray::Base64DecodingStatus::Ok) {
        set_error(FormatError::InvalidBase64, QStringLiteral("The input is not a valid Base-64 string."), error, message);
        return std::nullopt;
    }
    return result.decoded;
}

QString hex_dump(const QByteArray &data, int offset, int count) {
    offset = std::clamp(offset, 0, static_cast<int>(data.size()));
    count = std::clamp(count, 0, static_cast<int>(data.size()) - offset);

    QString out;
    out.reserve((count / kDumpBytesPerLine + 1) * 80);
    for (int i = 0; i < count; i += kDumpBytesPerLine) {
        const int lineCount = std::min(kDumpBytesPerLine, count - i);
        out.append(QStringLiteral("%1  ").arg(offset + i, 8, 16, QLatin1Char('0')));
        for (int j = 0; j < kDumpBytesPerLine; ++j) {
            if (j < lineCount) {
                const auto byte = static_cast<uint>(static_cast<uint8_t>(data.at(offset + i + j)));
                out.append(QStringLiteral("%1 ").arg(byte, 2, 16, QLatin1Char('0')));
            } else {
                out.append(QStringLiteral("   "));
            }
            if (j == 7) {
                out.append(QLatin1Char(' '));
            }
        }
        out.append(QStringLiteral(" |"));
        for (int j = 0; j < lineCount; ++j) {
            const auto byte = static_cast<uint8_t>(data.at(offset + i + j));
            out.append(is_printable(byte) ? QLatin1Char(static_cast<char>(byte)) : QLatin1Char('.'));
        }
        out.append(QLatin1Char('|'));
        if (i + kDumpBytesPerLine < count) {
            out.append(QLatin1Char('\n'));
        }
    }
    return out;
}

QString hex_dump(const QByteArray &data) {
    return hex_dump(data, 0, static_cast<int>(data.size()));
}

QString to_hex_string(const QByteArray &data, int offset, int count) {
    if (count < 0) {
        count = static_cast<int>(data.size()) - offset;
    }
    return QString::fromLatin1(data.mid(offset, count).toHex(' '));
}

QString ascii_preview(const QByteArray &data) {
    QString text;
    text.reserve(data.size());
    for (const char c : data) {
        const auto byte = static_cast<uint8_t>(c);
        if (byte == '\r') {
            text.append(QStringLiteral("\\r"));
        } else if (byte == '\n') {
            text.append(QStringLiteral("\\n"));
        } else if (byte >= 0x80) {
            text.append(QLatin1Char('?'));
        } else {
            text.append(QLatin1Char(c));
        }
    }
    return text;
}

}  // namespace nd::codec
