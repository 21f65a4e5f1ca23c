// Energy Log Example
// A single-column timeline of energy entries backed by a JSON file.
// Usage: energy_log [entries.json]

#include "json_file_store.h"

#include <entrylog/entrylog.h>

#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QStandardPaths>
#include <QtGui/QGuiApplication>
#include <QtQml/QQmlApplicationEngine>
#include <QtQml/QQmlContext>
#include <QtQml/qqml.h>

#include <cstdlib>
#include <memory>

namespace {

QString default_store_path()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dir);
    return dir + QStringLiteral("/entries.json");
}

} // namespace

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);
    app.setApplicationName("Energy Log");
    app.setApplicationVersion(entrylog::k_version_string);
    app.setOrganizationName("Entrylog");

    const QStringList args = app.arguments();
    const QString path = args.size() > 1 ? args.at(1) : default_store_path();

    qmlRegisterType<entrylog::Timeline_interaction_item>("Entrylog", 1, 0, "TimelineInteraction");
    qmlRegisterUncreatableType<entrylog::Timeline_controller>("Entrylog", 1, 0, "TimelineController",
        "The timeline controller is created by the application");

    auto store = std::make_shared<Json_file_store>(path);

    entrylog::Timeline_controller controller;
    controller.set_entry_source(store);
    controller.set_entry_sink(store);
    QObject::connect(
        &controller,
        &entrylog::Timeline_controller::refresh_finished,
        &app,
        [](bool ok) {
            if (!ok) {
                qWarning() << "energy_log: starting with an empty timeline";
            }
        },
        Qt::SingleShotConnection);
    if (!controller.refresh()) {
        qWarning() << "energy_log: no entry source for" << path;
    }

    QQmlApplicationEngine engine;
    engine.rootContext()->setContextProperty("timeline", &controller);

    const QUrl url("qrc:/qml/main.qml");

    QObject::connect(
        &engine,
        &QQmlApplicationEngine::objectCreated,
        &app,
        [url](QObject* obj, const QUrl& obj_url) {
            if (!obj && url == obj_url) {
                QCoreApplication::exit(EXIT_FAILURE);
            }
        },
        Qt::QueuedConnection);

    engine.load(url);

    return app.exec();
}
