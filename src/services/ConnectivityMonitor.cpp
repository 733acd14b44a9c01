#include "services/ConnectivityMonitor.hpp"
#include "log/log_categories.hpp"
#include "log/SystemLogger.hpp"

#include <QTimer>
#include <QDebug>

ConnectivityMonitor::ConnectivityMonitor(std::unique_ptr<IBackendClient> client, const ProbeParams& params,
                                         QObject* parent)
	: QObject(parent), client_(std::move(client)), params_(params)
{
}

ConnectivityMonitor::~ConnectivityMonitor() = default;

int ConnectivityMonitor::nextProbeDelayMs() const
{
	return settled_ == ConnectivityState::Online ? params_.onlineKeepAliveMs : params_.offlineProbeMs;
}

void ConnectivityMonitor::start()
{
	stopped_ = false;
	if (!timer_) {
		timer_ = new QTimer(this);
		timer_->setSingleShot(true);
		connect(timer_, &QTimer::timeout, this, &ConnectivityMonitor::probeNow);
	}
	qCInfo(LC_NET) << "[ConnectivityMonitor] started, offline probe" << params_.offlineProbeMs
	               << "ms, keep-alive" << params_.onlineKeepAliveMs << "ms";
	probeNow();
}

void ConnectivityMonitor::stop()
{
	stopped_ = true;
	if (timer_) timer_->stop();
}

void ConnectivityMonitor::releaseResources()
{
	stop();
	client_.reset();
}

void ConnectivityMonitor::probeNow()
{
	if (probing_ || stopped_ || !client_) return;
	probing_ = true;

	state_ = ConnectivityState::Probing;
	emit stateChanged(ConnectivityState::Probing);

	// timeout and connection refused both come back as false
	const bool ok = client_->checkHealth();
	const ConnectivityState next = ok ? ConnectivityState::Online : ConnectivityState::Offline;

	state_ = next;
	emit stateChanged(next);

	if (next != settled_) {
		qCInfo(LC_NET) << "[ConnectivityMonitor]" << States::toString(settled_) << "->" << States::toString(next);
		if (ok) SystemLogger::info(QStringLiteral("NET"), QStringLiteral("backend reachable"));
		else    SystemLogger::warn(QStringLiteral("NET"), QStringLiteral("backend unreachable"));
		settled_ = next;
		emit reachabilityChanged(ok);
	}

	probing_ = false;
	schedule();
}

void ConnectivityMonitor::schedule()
{
	if (stopped_ || !timer_) return;
	timer_->start(nextProbeDelayMs());
}
