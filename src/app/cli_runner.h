#pragma once

#include <QString>
#include <QStringList>
#include <QTextStream>

#include <memory>

class QCommandLineParser;

namespace hr {

class EmbeddingProviderRegistry;
class HttpTransport;
class KnowledgeEngine;
class KnowledgeStore;
class LocalVectorIndex;
struct Settings;

// Command-line front end. Each command prints JSON on stdout and returns a
// process exit code.
class CliRunner {
public:
    CliRunner(QTextStream& out, QTextStream& err);
    ~CliRunner();

    CliRunner(const CliRunner&) = delete;
    CliRunner& operator=(const CliRunner&) = delete;

    int run(const QStringList& arguments);

private:
    bool openEngine(const Settings& settings);

    int ingest(const QStringList& positional, const QCommandLineParser& parser);
    int search(const QStringList& positional, const QCommandLineParser& parser);
    int sync(const QCommandLineParser& parser);
    int providers();
    int useProvider(const QStringList& positional, Settings& settings, const QString& settingsPath);
    int health();
    int formulas(const QStringList& positional);
    int regulations(const QStringList& positional);

    QTextStream& m_out;
    QTextStream& m_err;

    std::unique_ptr<HttpTransport> m_transport;
    std::unique_ptr<KnowledgeStore> m_store;
    std::unique_ptr<LocalVectorIndex> m_index;
    std::unique_ptr<EmbeddingProviderRegistry> m_registry;
    std::unique_ptr<KnowledgeEngine> m_engine;
};

} // namespace hr
