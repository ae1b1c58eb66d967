#ifndef ADDRESSRESOLVER_H
#define ADDRESSRESOLVER_H

#include <QString>
#include <QUrl>

class ResolvedTarget
{
public:
    enum Kind {
        None,
        Url,
        Search
    };

    ResolvedTarget() : m_kind(None) {}
    ResolvedTarget(Kind kind, const QString &value) : m_kind(kind), m_value(value) {}

    Kind kind() const { return m_kind; }
    QString value() const { return m_value; }
    bool isNull() const { return m_kind == None; }
    QUrl url() const;

    bool operator==(const ResolvedTarget &other) const
    {
        return m_kind == other.m_kind && m_value == other.m_value;
    }
    bool operator!=(const ResolvedTarget &other) const { return !(*this == other); }

private:
    Kind m_kind;
    QString m_value;
};

// Decides whether address bar text is a location or a search query.
class AddressResolver
{
public:
    explicit AddressResolver(const QString &searchBaseUrl = defaultSearchBaseUrl());

    ResolvedTarget resolve(const QString &input) const;
    ResolvedTarget search(const QString &input) const;

    static QString defaultSearchBaseUrl();
    static bool hasRecognizedScheme(const QString &input);
    static QString encodeQuery(const QString &query);

private:
    QString m_searchBaseUrl;
};

#endif // ADDRESSRESOLVER_H
