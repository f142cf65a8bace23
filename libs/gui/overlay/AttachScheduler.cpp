#include "AttachScheduler.hpp"
#include "../../core/VantageLogging.hpp"

#include <QPointer>
#include <algorithm>

namespace vantage {

AttachScheduler::AttachScheduler(IChartHost* host, AttachSchedulerConfig config, QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_config(config)
    , m_timer(new QTimer(this))
{
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, [this]() { flush("deadline"); });
}

AttachScheduler::~AttachScheduler() {
    cancelAll();
}

void AttachScheduler::setHost(IChartHost* host) {
    if (m_host == host) return;
    cancelAll();
    m_host = host;
}

void AttachScheduler::schedule(Task task) {
    if (!task) return;

    if (m_host && m_host->isReady() && m_pending.empty()) {
        task();
        return;
    }

    m_pending.push_back(std::move(task));
    hookHostReady();
    armTimer();
}

void AttachScheduler::cancelAll() {
    m_timer->stop();
    if (!m_pending.empty()) {
        vLog_Render("Cancelled" << m_pending.size() << "pending attachments");
    }
    m_pending.clear();
}

void AttachScheduler::hookHostReady() {
    if (!m_host || m_hookedHost == m_host) return;
    IChartHost* host = m_host;
    m_hookedHost = host;

    // The host keeps the callback; guard against this scheduler dying or moving to another host
    QPointer<AttachScheduler> self(this);
    host->onReady([self, host]() {
        if (!self || self->m_hookedHost != host) return;
        self->m_hookedHost = nullptr;
        if (self->m_host == host) self->flush("ready");
    });
}

void AttachScheduler::armTimer() {
    // hookHostReady() may already have flushed when the host turned ready meanwhile
    if (m_pending.empty()) return;
    if (m_pending.size() == 1) m_queuedSince.start();

    // Each queued task pushes the deadline out by one stagger step, measured from the
    // first queued task and capped at maxDelayMs
    const int queued = static_cast<int>(m_pending.size());
    const int target = std::min(m_config.readyDelayMs + m_config.staggerStepMs * (queued - 1),
                                m_config.maxDelayMs);
    const int remaining = target - static_cast<int>(m_queuedSince.elapsed());
    m_timer->start(std::max(0, remaining));
}

void AttachScheduler::flush(const char* reason) {
    m_timer->stop();

    std::vector<Task> tasks;
    tasks.swap(m_pending);
    if (tasks.empty()) return;

    vLog_Render("Attaching" << tasks.size() << "deferred primitives on" << reason);
    for (auto& task : tasks) {
        task();
    }
    emit flushed(static_cast<int>(tasks.size()));
}

} // namespace vantage
