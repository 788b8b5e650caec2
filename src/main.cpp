#include "planmark.hpp"

#include <QCoreApplication>
#include <QDebug>
#include <QLoggingCategory>

int
main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("planmark");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    argparse::ArgumentParser program("planmark", APP_VERSION,
                                     argparse::default_arguments::all);
    init_args(program);
    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception &e)
    {
        qCritical().noquote() << e.what();
        qCritical().noquote() << QString::fromStdString(program.help().str());
        return 1;
    }

    if (!program.get<bool>("--verbose"))
        QLoggingCategory::setFilterRules("*.debug=false");

    planmark p;
    if (!p.ReadArgsParser(program))
        return 1;
    return p.Run();
}
