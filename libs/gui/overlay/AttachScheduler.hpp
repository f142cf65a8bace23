/*
Vantage — AttachScheduler
Role: Defers primitive attachment until the chart host can map coordinates.
Inputs/Outputs: Attachment tasks in; each runs exactly once (or never, when cancelled).
Threading: GUI thread. Timer and host-ready callbacks fire on the same thread.
Performance: One single-shot QTimer for the whole queue; tasks run in submission order.
Integration: Owned by SeriesOverlayRegistry. clearAllShapes(), context switches and destruction
  call cancelAll(). At most one host-ready callback is outstanding per host; it flushes whatever
  is queued when it fires, so cancel/schedule cycles never pile callbacks up in the host.
Observability: vLog_Render when a queue is flushed, with the reason (ready / deadline).
Related: AttachScheduler.cpp, OverlayDefaults.hpp (AttachSchedulerConfig), ChartHost.hpp.
Assumptions: A task that runs after the deadline against a host that is still not ready is
  harmless; primitives simply resolve nothing until the first layout.
*/
#pragma once
#include "OverlayDefaults.hpp"
#include "../host/ChartHost.hpp"

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>
#include <functional>
#include <vector>

namespace vantage {

class AttachScheduler : public QObject {
    Q_OBJECT

public:
    using Task = std::function<void()>;

    explicit AttachScheduler(IChartHost* host, AttachSchedulerConfig config = {}, QObject* parent = nullptr);
    ~AttachScheduler() override;

    void setHost(IChartHost* host);

    // Runs the task now when the host is ready; otherwise queues it behind the host-ready
    // notification with a bounded fallback delay
    void schedule(Task task);

    // Drops every queued task; an outstanding host-ready callback stays registered and finds
    // an empty queue unless new tasks arrive first
    void cancelAll();

    size_t pendingCount() const { return m_pending.size(); }
    const AttachSchedulerConfig& config() const { return m_config; }

signals:
    void flushed(int taskCount);

private:
    void flush(const char* reason);
    void armTimer();
    void hookHostReady();

    IChartHost* m_host = nullptr;
    AttachSchedulerConfig m_config;
    QTimer* m_timer;
    QElapsedTimer m_queuedSince;
    std::vector<Task> m_pending;
    // Host holding our outstanding ready callback; nullptr once it fired
    IChartHost* m_hookedHost = nullptr;
};

} // namespace vantage
