#define DOCTEST_CONFIG_IMPLEMENT

#include "doctest/doctest.h"

#include "app/LoadCoordinator.h"
#include "common/Settings.h"
#include "io/EmbeddedModel.h"
#include "render/Model.h"
#include "render/PlaybackController.h"
#include "render/RenderObject.h"
#include "render/ResourceLifecycleManager.h"
#include "render/Scene.h"

#include <QtCore/QCoreApplication>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>
#include <QtCore/QTimer>

namespace
{

constexpr int kTimeoutMs = 30'000;

struct Fixture
{
    render::Scene scene;
    render::PlaybackController playback;
    render::ResourceLifecycleManager manager{scene, playback};
    app::LoadCoordinator coordinator{manager, common::Settings{}};

    // Spins the event loop until every worker has reported back. Returns false on timeout.
    bool waitUntilIdle()
    {
        QEventLoop loop;
        QTimer timeout;
        timeout.setSingleShot(true);
        bool timedOut = false;
        QObject::connect(&timeout, &QTimer::timeout, &loop, [&]() {
            timedOut = true;
            loop.quit();
        });
        QObject::connect(&coordinator, &app::LoadCoordinator::idle, &loop, &QEventLoop::quit);
        timeout.start(kTimeoutMs);
        if (coordinator.runningWorkers() > 0 || !pendingDone())
        {
            loop.exec();
        }
        return !timedOut;
    }

    [[nodiscard]] bool pendingDone() const
    {
        return !manager.isLoading(render::Slot::Model) && !manager.isLoading(render::Slot::Path);
    }
};

QString writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& bytes)
{
    const QString path = dir.filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
    {
        file.write(bytes);
    }
    return path;
}

} // namespace

DOCTEST_TEST_CASE(default_assets_load_through_workers)
{
    Fixture f;
    f.coordinator.requestModel(QString());
    f.coordinator.requestProgram(QString());

    DOCTEST_REQUIRE(f.waitUntilIdle());

    DOCTEST_REQUIRE(f.manager.activeModel());
    DOCTEST_CHECK(f.manager.activeModel()->model()->triangleCount() == 12);
    DOCTEST_CHECK(f.scene.contains(f.manager.activeModel().get()));
    DOCTEST_CHECK(f.manager.pathVertices().size() == 28);
    DOCTEST_REQUIRE(f.manager.pathStatus().has_value());
    DOCTEST_CHECK(*f.manager.pathStatus() == gcode::PathStatus::Ok);
    DOCTEST_CHECK(f.pendingDone());
}

DOCTEST_TEST_CASE(superseded_model_request_never_reaches_the_scene)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QByteArray stl(io::kEmbeddedModelStl.data(), static_cast<qsizetype>(io::kEmbeddedModelStl.size()));
    const QString fileA = writeFile(dir, QStringLiteral("a.stl"), stl);
    const QString fileB = writeFile(dir, QStringLiteral("b.stl"), stl);

    Fixture f;
    int installs = 0;
    QObject::connect(&f.manager, &render::ResourceLifecycleManager::modelChanged, [&installs]() { ++installs; });

    const render::LoadTicket a = f.coordinator.requestModel(fileA);
    const render::LoadTicket b = f.coordinator.requestModel(fileB);
    DOCTEST_CHECK_FALSE(f.manager.isCurrent(a));
    DOCTEST_CHECK(f.manager.isCurrent(b));

    DOCTEST_REQUIRE(f.waitUntilIdle());

    DOCTEST_REQUIRE(f.manager.activeModel());
    DOCTEST_CHECK(f.manager.activeModel()->model()->name() == QStringLiteral("b.stl"));
    DOCTEST_CHECK(installs == 1);
    DOCTEST_CHECK(f.scene.size() == 1);
}

DOCTEST_TEST_CASE(failed_request_surfaces_an_error)
{
    Fixture f;
    QString message;
    QObject::connect(&f.manager, &render::ResourceLifecycleManager::loadFailed,
                     [&message](render::Slot, const QString& text) { message = text; });

    f.coordinator.requestModel(QStringLiteral("/nonexistent/part.stl"));
    f.coordinator.requestProgram(QStringLiteral("/nonexistent/job.gcode"));
    DOCTEST_REQUIRE(f.waitUntilIdle());

    DOCTEST_CHECK_FALSE(f.manager.activeModel());
    DOCTEST_CHECK(f.manager.pathVertices().empty());
    DOCTEST_REQUIRE(f.manager.error(render::Slot::Model).has_value());
    DOCTEST_CHECK(f.manager.error(render::Slot::Model)->kind == io::LoadErrorKind::SourceRead);
    DOCTEST_REQUIRE(f.manager.error(render::Slot::Path).has_value());
    DOCTEST_CHECK(message.startsWith(QStringLiteral("Failed to read file")));
}

DOCTEST_TEST_CASE(teardown_discards_inflight_results)
{
    const std::size_t baseline = render::RenderObject::undisposedCount();
    {
        Fixture f;
        f.coordinator.requestModel(QString());
        f.manager.teardown();
        f.coordinator.waitForWorkers();
        QCoreApplication::processEvents();

        DOCTEST_CHECK_FALSE(f.manager.activeModel());
        DOCTEST_CHECK(f.scene.empty());
    }
    QCoreApplication::processEvents();
    DOCTEST_CHECK(render::RenderObject::undisposedCount() == baseline);
}

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
