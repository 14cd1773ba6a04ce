/*
 * markdownparser.cpp — MD4C reduction of Markdown to plain reading text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markdownparser.h"

#include <KLocalizedString>

#include <QHash>

#include <md4c.h>

namespace {

class MarkdownReducer
{
public:
    bool run(const QByteArray &utf8)
    {
        MD_PARSER parser = {};
        parser.abi_version = 0;
        parser.flags = MD_DIALECT_GITHUB | MD_FLAG_UNDERLINE;
        parser.enter_block = &MarkdownReducer::sEnterBlock;
        parser.leave_block = &MarkdownReducer::sLeaveBlock;
        parser.enter_span = &MarkdownReducer::sEnterSpan;
        parser.leave_span = &MarkdownReducer::sLeaveSpan;
        parser.text = &MarkdownReducer::sText;

        return md_parse(utf8.constData(), static_cast<MD_SIZE>(utf8.size()),
                        &parser, this) == 0;
    }

    QString text() const { return m_text; }

private:
    static int sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
    { return static_cast<MarkdownReducer *>(userdata)->enterBlock(type, detail); }
    static int sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
    { return static_cast<MarkdownReducer *>(userdata)->leaveBlock(type, detail); }
    static int sEnterSpan(MD_SPANTYPE, void *, void *) { return 0; }
    static int sLeaveSpan(MD_SPANTYPE, void *, void *) { return 0; }
    static int sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size, void *userdata)
    { return static_cast<MarkdownReducer *>(userdata)->onText(type, text, size); }

    int enterBlock(MD_BLOCKTYPE type, void * /*detail*/)
    {
        switch (type) {
        case MD_BLOCK_TD:
        case MD_BLOCK_TH:
            appendSeparator();
            break;
        default:
            break;
        }
        return 0;
    }

    int leaveBlock(MD_BLOCKTYPE type, void * /*detail*/)
    {
        switch (type) {
        case MD_BLOCK_P:
        case MD_BLOCK_CODE:
        case MD_BLOCK_H:
        case MD_BLOCK_LI:
        case MD_BLOCK_HTML:
        case MD_BLOCK_TR:
            endParagraph();
            break;
        default:
            break;
        }
        return 0;
    }

    int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size)
    {
        const QString str = QString::fromUtf8(text, static_cast<qsizetype>(size));

        switch (type) {
        case MD_TEXT_NORMAL:
        case MD_TEXT_CODE:
        case MD_TEXT_LATEXMATH:
            // Code block lines arrive with their own newlines; single line
            // breaks are whitespace to the segmenter.
            m_text.append(str);
            break;
        case MD_TEXT_BR:
        case MD_TEXT_SOFTBR:
            m_text.append(QLatin1Char(' '));
            break;
        case MD_TEXT_ENTITY:
            m_text.append(resolveEntity(str));
            break;
        case MD_TEXT_NULLCHAR:
            m_text.append(QChar(0xFFFD));
            break;
        case MD_TEXT_HTML:
            break;
        }
        return 0;
    }

    void appendSeparator()
    {
        if (!m_text.isEmpty() && !m_text.endsWith(QLatin1Char('\n')))
            m_text.append(QLatin1Char(' '));
    }

    void endParagraph()
    {
        if (m_text.isEmpty() || m_text.endsWith(QLatin1String("\n\n")))
            return;
        if (!m_text.endsWith(QLatin1Char('\n')))
            m_text.append(QLatin1Char('\n'));
        m_text.append(QLatin1Char('\n'));
    }

    static QString resolveEntity(const QString &entity)
    {
        static const QHash<QString, QString> entities = {
            {QStringLiteral("&amp;"),    QStringLiteral("&")},
            {QStringLiteral("&lt;"),     QStringLiteral("<")},
            {QStringLiteral("&gt;"),     QStringLiteral(">")},
            {QStringLiteral("&quot;"),   QStringLiteral("\"")},
            {QStringLiteral("&apos;"),   QStringLiteral("'")},
            {QStringLiteral("&nbsp;"),   QString(QChar(0x00A0))},
            {QStringLiteral("&mdash;"),  QString(QChar(0x2014))},
            {QStringLiteral("&ndash;"),  QString(QChar(0x2013))},
            {QStringLiteral("&lsquo;"),  QString(QChar(0x2018))},
            {QStringLiteral("&rsquo;"),  QString(QChar(0x2019))},
            {QStringLiteral("&ldquo;"),  QString(QChar(0x201C))},
            {QStringLiteral("&rdquo;"),  QString(QChar(0x201D))},
            {QStringLiteral("&hellip;"), QString(QChar(0x2026))},
        };
        auto it = entities.constFind(entity);
        if (it != entities.constEnd())
            return it.value();
        if (entity.startsWith(QLatin1String("&#")) && entity.endsWith(QLatin1Char(';'))) {
            const QString num = entity.mid(2, entity.size() - 3);
            bool ok = false;
            uint code;
            if (num.startsWith(QLatin1Char('x'), Qt::CaseInsensitive))
                code = num.mid(1).toUInt(&ok, 16);
            else
                code = num.toUInt(&ok, 10);
            if (ok && code > 0 && code <= 0x10FFFF) {
                const char32_t ch = code;
                return QString::fromUcs4(&ch, 1);
            }
        }
        return entity;
    }

    QString m_text;
};

} // namespace

QStringList MarkdownParser::extensions() const
{
    return {QStringLiteral("md"), QStringLiteral("markdown")};
}

bool MarkdownParser::extractText(const QByteArray &bytes, QString &text,
                                 QString &errorDetail) const
{
    QString markdown;
    if (!decodeUtf8(bytes, markdown, errorDetail))
        return false;

    MarkdownReducer reducer;
    if (!reducer.run(markdown.toUtf8())) {
        errorDetail = i18n("the Markdown parser rejected the document");
        return false;
    }
    text = reducer.text();
    return true;
}
