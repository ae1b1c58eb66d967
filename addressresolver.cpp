#include "addressresolver.h"
#include "logging.h"

namespace {

struct SchemePrefix {
    const char *prefix;
    int length;
};

// Hierarchical schemes carry "//", the rest are opaque.
const SchemePrefix RecognizedSchemes[] = {
    { "http://", 7 },
    { "https://", 8 },
    { "file://", 7 },
    { "ftp://", 6 },
    { "about:", 6 },
    { "data:", 5 },
    { "view-source:", 12 },
};

}

QUrl ResolvedTarget::url() const
{
    if (m_kind == None)
        return QUrl();
    return QUrl(m_value, QUrl::TolerantMode);
}

AddressResolver::AddressResolver(const QString &searchBaseUrl)
    : m_searchBaseUrl(searchBaseUrl)
{
}

QString AddressResolver::defaultSearchBaseUrl()
{
    return QStringLiteral("https://duckduckgo.com/?q=");
}

bool AddressResolver::hasRecognizedScheme(const QString &input)
{
    for (const SchemePrefix &scheme : RecognizedSchemes) {
        if (input.startsWith(QLatin1String(scheme.prefix, scheme.length), Qt::CaseInsensitive))
            return true;
    }
    return false;
}

QString AddressResolver::encodeQuery(const QString &query)
{
    QByteArray encoded = QUrl::toPercentEncoding(query);
    encoded.replace("%20", "+");
    return QString::fromLatin1(encoded);
}

ResolvedTarget AddressResolver::resolve(const QString &input) const
{
    const QString text = input.trimmed();
    if (text.isEmpty())
        return ResolvedTarget();

    if (hasRecognizedScheme(text)) {
        qCDebug(lcAddress) << "url with scheme:" << text;
        return ResolvedTarget(ResolvedTarget::Url, text);
    }

    bool hasSpace = false;
    for (const QChar c : text) {
        if (c.isSpace()) {
            hasSpace = true;
            break;
        }
    }
    if (!hasSpace && text.contains(QLatin1Char('.'))) {
        qCDebug(lcAddress) << "bare host:" << text;
        return ResolvedTarget(ResolvedTarget::Url, QStringLiteral("https://") + text);
    }

    return search(text);
}

ResolvedTarget AddressResolver::search(const QString &input) const
{
    const QString text = input.trimmed();
    if (text.isEmpty())
        return ResolvedTarget();

    qCDebug(lcAddress) << "search query:" << text;
    return ResolvedTarget(ResolvedTarget::Search, m_searchBaseUrl + encodeQuery(text));
}
