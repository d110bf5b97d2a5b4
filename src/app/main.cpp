#include "cli_runner.h"

#include <QCoreApplication>
#include <QTextStream>

#include <cstdio>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("hybridrag"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QTextStream out(stdout);
    QTextStream err(stderr);

    hr::CliRunner runner(out, err);
    return runner.run(app.arguments());
}
