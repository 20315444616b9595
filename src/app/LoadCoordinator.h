#pragma once

#include "common/Settings.h"
#include "render/ResourceLifecycleManager.h"

#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>

class QThread;

namespace app
{

// Starts a worker per load request and routes its result to the lifecycle
// manager under the ticket issued when the request was made.
class LoadCoordinator : public QObject
{
    Q_OBJECT

public:
    LoadCoordinator(render::ResourceLifecycleManager& resources,
                    common::Settings settings,
                    QObject* parent = nullptr);
    ~LoadCoordinator() override;

    // An empty path requests the default asset.
    render::LoadTicket requestModel(const QString& path);
    render::LoadTicket requestProgram(const QString& path);

    [[nodiscard]] int runningWorkers() const;
    void waitForWorkers();

Q_SIGNALS:
    void idle();

private:
    void track(QThread* worker);

    render::ResourceLifecycleManager& m_resources;
    common::Settings m_settings;
    QList<QPointer<QThread>> m_workers;
};

} // namespace app
