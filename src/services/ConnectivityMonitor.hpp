#pragma once
#include <atomic>
#include <memory>
#include <QObject>

#include "include/states.hpp"
#include "net/BackendClient.hpp"

class QTimer;

struct ProbeParams {
	int offlineProbeMs = 5000;			// probe period while Offline
	int onlineKeepAliveMs = 30000;		// probe period while Online
};

// Backend reachability. Lives on its own thread; probes with GET /health.
class ConnectivityMonitor : public QObject {
	Q_OBJECT
public:
	ConnectivityMonitor(std::unique_ptr<IBackendClient> client, const ProbeParams& params,
	                    QObject* parent = nullptr);
	~ConnectivityMonitor() override;

	ConnectivityState state() const { return state_.load(); }
	bool isOnline() const { return state_.load() == ConnectivityState::Online; }

	// ms until the next scheduled probe for the current settled state
	int nextProbeDelayMs() const;

public slots:
	void start();
	void stop();
	void probeNow();
	void releaseResources();

signals:
	void stateChanged(ConnectivityState state);		// every transition, Probing included
	void reachabilityChanged(bool online);			// Online <-> Offline flips only

private:
	void schedule();

	std::unique_ptr<IBackendClient> client_;
	ProbeParams params_;
	QTimer* timer_ = nullptr;
	std::atomic<ConnectivityState> state_ { ConnectivityState::Offline };
	ConnectivityState settled_ = ConnectivityState::Offline;
	bool probing_ = false;
	bool stopped_ = false;
};
