#include "app/LoadCoordinator.h"

#include "common/log.h"
#include "io/MeshLoadWorker.h"
#include "io/PathLoadWorker.h"
#include "render/Model.h"
#include "render/RenderObject.h"

#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>

#include <algorithm>
#include <utility>

namespace app
{

namespace
{

constexpr QVector3D kModelColor{0.67f, 0.67f, 0.67f};

QString describeSource(const QString& path)
{
    return path.isEmpty() ? QStringLiteral("<default>") : QFileInfo(path).fileName();
}

} // namespace

LoadCoordinator::LoadCoordinator(render::ResourceLifecycleManager& resources,
                                 common::Settings settings,
                                 QObject* parent)
    : QObject(parent)
    , m_resources(resources)
    , m_settings(std::move(settings))
{
}

LoadCoordinator::~LoadCoordinator()
{
    waitForWorkers();
}

render::LoadTicket LoadCoordinator::requestModel(const QString& path)
{
    const render::LoadTicket ticket = m_resources.beginLoad(render::Slot::Model);
    LOG_INFO(App, QStringLiteral("Model load #%1 started: %2").arg(ticket.generation).arg(describeSource(path)));

    auto* worker = new io::MeshLoadWorker(path, m_settings.assets.defaultModelPath, m_settings.mesh, this);

    QElapsedTimer timer;
    timer.start();

    connect(worker,
            &io::MeshLoadWorker::loaded,
            this,
            [this, ticket, timer](std::shared_ptr<render::Model> model) {
                auto mesh = std::make_shared<render::MeshObject>(std::move(model), kModelColor);
                if (m_resources.completeModelLoad(ticket, std::move(mesh)))
                {
                    LOG_INFO(App, QStringLiteral("Model load #%1 finished in %2 ms.").arg(ticket.generation).arg(timer.elapsed()));
                }
            });
    connect(worker, &io::MeshLoadWorker::failed, this, [this, ticket](const io::LoadError& error) {
        m_resources.failLoad(ticket, error);
    });

    track(worker);
    worker->start();
    return ticket;
}

render::LoadTicket LoadCoordinator::requestProgram(const QString& path)
{
    const render::LoadTicket ticket = m_resources.beginLoad(render::Slot::Path);
    LOG_INFO(App, QStringLiteral("Program load #%1 started: %2").arg(ticket.generation).arg(describeSource(path)));

    gcode::PathBuildOptions options;
    options.fallbackEnabled = m_settings.path.fallbackEnabled;
    options.fallbackLength = m_settings.path.fallbackLength;

    auto* worker = new io::PathLoadWorker(path, m_settings.assets.defaultProgramPath, options, this);

    QElapsedTimer timer;
    timer.start();

    connect(worker,
            &io::PathLoadWorker::loaded,
            this,
            [this, ticket, timer](std::shared_ptr<gcode::PathBuildResult> result) {
                if (m_resources.completePathLoad(ticket, std::move(*result)))
                {
                    LOG_INFO(App, QStringLiteral("Program load #%1 finished in %2 ms.").arg(ticket.generation).arg(timer.elapsed()));
                }
            });
    connect(worker, &io::PathLoadWorker::failed, this, [this, ticket](const io::LoadError& error) {
        m_resources.failLoad(ticket, error);
    });

    track(worker);
    worker->start();
    return ticket;
}

int LoadCoordinator::runningWorkers() const
{
    return static_cast<int>(std::count_if(m_workers.begin(), m_workers.end(), [](const QPointer<QThread>& worker) {
        return worker && !worker->isFinished();
    }));
}

void LoadCoordinator::waitForWorkers()
{
    for (const QPointer<QThread>& worker : std::as_const(m_workers))
    {
        if (worker)
        {
            worker->wait();
        }
    }
}

void LoadCoordinator::track(QThread* worker)
{
    m_workers.append(QPointer<QThread>(worker));

    connect(worker, &QThread::finished, this, [this, worker]() {
        m_workers.removeAll(QPointer<QThread>(worker));
        worker->deleteLater();
        if (m_workers.isEmpty())
        {
            Q_EMIT idle();
        }
    });
}

} // namespace app
