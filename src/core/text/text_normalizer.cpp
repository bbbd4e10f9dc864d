#include "core/text/text_normalizer.h"

#include <QRegularExpression>

#include <utility>

namespace pm {

namespace {

struct Expansion {
    const char* abbreviation;
    const char* expansion;
};

// Whole-word replacements, applied in order after punctuation cleanup.
constexpr Expansion kWordExpansions[] = {
    {"hx", "hex"},
    {"hd", "head"},
    {"scr", "screw"},
    {"zp", "zinc plated"},
    {"ss", "stainless steel"},
    {"alum", "aluminum"},
    {"galv", "galvanized"},
    {"stl", "steel"},
    {"blk", "black"},
    {"wht", "white"},
    {"assy", "assembly"},
    {"qty", "quantity"},
    {"pkg", "package"},
};

constexpr Expansion kPhraseFixes[] = {
    {"st steel", "stainless steel"},
    {"stainless st", "stainless steel"},
    {"zinc pl", "zinc plated"},
};

bool isWordChar(QChar ch)
{
    return ch.isLetterOrNumber();
}

// Replaces whole-word occurrences of `from` in a single-spaced string.
QString replaceWord(const QString& text, const QString& from, const QString& to)
{
    QString result;
    result.reserve(text.size() + 16);
    int pos = 0;
    while (pos < text.size()) {
        const int hit = text.indexOf(from, pos);
        if (hit < 0) {
            break;
        }
        const int end = hit + from.size();
        const bool leftOk = hit == 0 || !isWordChar(text.at(hit - 1));
        const bool rightOk = end >= text.size() || !isWordChar(text.at(end));
        if (leftOk && rightOk) {
            result.append(text.mid(pos, hit - pos));
            result.append(to);
            pos = end;
        } else {
            result.append(text.mid(pos, hit + 1 - pos));
            pos = hit + 1;
        }
    }
    result.append(text.mid(pos));
    return result;
}

QString collapseWhitespace(const QString& text)
{
    QString out;
    out.reserve(text.size());
    for (const QChar ch : text) {
        if (ch.isSpace()) {
            if (!out.isEmpty() && out.back() != QLatin1Char(' ')) {
                out.append(QLatin1Char(' '));
            }
            continue;
        }
        out.append(ch);
    }
    return out.trimmed();
}

} // namespace

QString TextNormalizer::normalize(const QString& raw)
{
    QString working = raw.trimmed().toLower();
    if (working.isEmpty()) {
        return QString();
    }

    for (QChar& ch : working) {
        if (ch.unicode() == 0x2013 || ch.unicode() == 0x2014) {
            ch = QLatin1Char('-');
        }
    }

    static const QRegularExpression withoutRe(QStringLiteral("(?<![\\w])w/o(?![\\w])"));
    static const QRegularExpression withRe(QStringLiteral("(?<![\\w])w/"));
    working.replace(withoutRe, QStringLiteral(" without "));
    working.replace(withRe, QStringLiteral(" with "));
    working.replace(QLatin1Char('&'), QStringLiteral(" and "));

    // "5 / 16 - 18" -> "5/16-18"
    static const QRegularExpression numericJoinRe(QStringLiteral("(\\d)\\s*([/-])\\s*(?=\\d)"));
    working.replace(numericJoinRe, QStringLiteral("\\1\\2"));

    // "5/16-18 x 2-1/2" -> "5/16-18x2-1/2"
    static const QRegularExpression lengthJoinRe(QStringLiteral("(\\d)\\s*x\\s*(?=\\d)"));
    working.replace(lengthJoinRe, QStringLiteral("\\1x"));

    QString cleaned;
    cleaned.reserve(working.size());
    for (int i = 0; i < working.size(); ++i) {
        const QChar ch = working.at(i);
        if (ch.isLetterOrNumber() || ch == QLatin1Char('.')) {
            cleaned.append(ch);
            continue;
        }
        if (ch == QLatin1Char('/') || ch == QLatin1Char('-')) {
            const bool digitBefore = i > 0 && working.at(i - 1).isDigit();
            const bool digitAfter = i + 1 < working.size() && working.at(i + 1).isDigit();
            cleaned.append(digitBefore && digitAfter ? ch : QLatin1Char(' '));
            continue;
        }
        cleaned.append(QLatin1Char(' '));
    }

    QString normalized = collapseWhitespace(cleaned);
    for (const Expansion& entry : kWordExpansions) {
        normalized = replaceWord(normalized,
                                 QLatin1String(entry.abbreviation),
                                 QLatin1String(entry.expansion));
    }
    for (const Expansion& entry : kPhraseFixes) {
        normalized = replaceWord(normalized,
                                 QLatin1String(entry.abbreviation),
                                 QLatin1String(entry.expansion));
    }
    return normalized;
}

DimensionTokens TextNormalizer::dimensionTokens(const QString& normalized)
{
    static const QRegularExpression threadRe(QStringLiteral("\\d+/\\d+-\\d+"));
    static const QRegularExpression lengthRe(QStringLiteral("(?<![a-z])x\\d+(?:-\\d+/\\d+|/\\d+|-\\d+)?"));

    DimensionTokens tokens;
    const QRegularExpressionMatch thread = threadRe.match(normalized);
    if (thread.hasMatch()) {
        tokens.thread = thread.captured(0);
    }
    const QRegularExpressionMatch length = lengthRe.match(normalized);
    if (length.hasMatch()) {
        tokens.length = length.captured(0);
    }
    return tokens;
}

} // namespace pm
