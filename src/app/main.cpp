#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>

#include <KAboutData>
#include <KLocalizedString>

#include "mainwindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("blinkreader");

    KAboutData aboutData(
        QStringLiteral("blinkreader"),
        i18n("BlinkReader"),
        QStringLiteral("0.1.0"),
        i18n("A one-word-at-a-time speed reader"),
        KAboutLicense::GPL_V3,
        i18n("(c) 2025-2026"),
        QString(),
        QString()
    );
    aboutData.setOrganizationDomain("blinkreader.org");
    aboutData.setDesktopFileName(
        QStringLiteral("org.blinkreader.BlinkReader"));

    KAboutData::setApplicationData(aboutData);
    app.setWindowIcon(QIcon::fromTheme(QStringLiteral("view-media-lyrics")));

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("file"),
        i18n("Text or Markdown file to open"),
        QStringLiteral("[file...]"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    MainWindow window;

    // Files on the command line open on top of the previous session
    window.restoreSession();
    const QStringList args = parser.positionalArguments();
    for (const QString &arg : args) {
        QFileInfo fi(arg);
        if (fi.exists() && fi.isFile())
            window.openFile(fi.absoluteFilePath());
        else
            qWarning() << "blinkreader: no such file" << arg;
    }

    window.show();
    return app.exec();
}
