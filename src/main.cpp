#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QProcessEnvironment>
#include <QTimer>
#include <QDebug>
#include <csignal>
#include <exception>
#include <memory>

#include "logger.hpp"
#include "config/KioskConfig.hpp"
#include "include/errors.hpp"
#include "log/SystemLogger.hpp"
#include "presenter/PipelineCoordinator.hpp"
#include "presenter/StatusPresenter.hpp"
#include "vision/ReplayVisionProvider.hpp"

static volatile std::sig_atomic_t g_stopRequested = 0;

static void onSignal(int)
{
		g_stopRequested = 1;
}

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName(QStringLiteral("attendance_kiosk"));

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
				QLoggingCategory::setFilterRules(
						"kiosk.fsm.debug=false\n"
						"kiosk.store.debug=false\n"
						"kiosk.net.debug=false\n"
				);

				QCommandLineParser parser;
				parser.setApplicationDescription(QStringLiteral("Attendance kiosk pipeline"));
				parser.addHelpOption();
				QCommandLineOption configOpt(QStringList{ "c", "config" },
						QStringLiteral("JSON configuration file."), QStringLiteral("file"));
				QCommandLineOption replayOpt(QStringList{ "r", "replay" },
						QStringLiteral("Detection script, one JSON frame per line."), QStringLiteral("file"));
				QCommandLineOption loopOpt(QStringLiteral("loop"), QStringLiteral("Restart the replay script at its end."));
				parser.addOption(configOpt);
				parser.addOption(replayOpt);
				parser.addOption(loopOpt);
				parser.process(app);

				const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
				QString configPath = parser.value(configOpt);
				if (configPath.isEmpty()) configPath = env.value(QStringLiteral(KIOSK_CONFIG_ENV));

				KioskConfig cfg;
				try {
						cfg = KioskConfig::load(configPath, env);
				} catch (const ConfigError& e) {
						qCritical() << "[" << __func__ << "] Configuration error:" << e.what();
						return 2;
				}

				if (!Logger::install(cfg.logDir))
						LOG_WARN(QStringLiteral("file logging disabled, cannot write to %1").arg(cfg.logDir));
				Logger::writef("attendance_kiosk starting, device=%s api=%s",
							   cfg.backend.deviceId.toUtf8().constData(), cfg.backend.baseUrl.toUtf8().constData());

				// 시스템로거 준비
				SystemLogger::init(cfg.storePath);
				SystemLogger::info("APP", "Logger initialized");

				PipelineCoordinator pipeline(cfg);
				StatusPresenter presenter(&pipeline);

				ReplayVisionProvider replay;
				if (parser.isSet(replayOpt)) {
						if (!replay.open(parser.value(replayOpt))) {
								LOG_CRITICAL(QStringLiteral("cannot read replay script %1").arg(parser.value(replayOpt)));
								SystemLogger::shutdown();
								return 1;
						}
						replay.setLoop(parser.isSet(loopOpt));
						pipeline.setVisionProvider(&replay);
				} else {
						LOG_INFO(QStringLiteral("no vision source given, running sync only"));
				}

				try {
						pipeline.start();
				} catch (const StoreError& e) {
						qCritical() << "[" << __func__ << "] Event store unavailable:" << e.what();
						pipeline.shutdown();
						SystemLogger::shutdown();
						return 3;
				}

				QTimer frameTimer;
				frameTimer.setTimerType(Qt::PreciseTimer);
				QObject::connect(&frameTimer, &QTimer::timeout, &pipeline, &PipelineCoordinator::tick);
				QObject::connect(&pipeline, &PipelineCoordinator::sourceExhausted, &frameTimer, [&frameTimer] {
						LOG_INFO(QStringLiteral("replay finished, waiting for sync (Ctrl+C to exit)"));
						frameTimer.stop();
				});
				if (parser.isSet(replayOpt)) frameTimer.start(1000 / cfg.fps);

				std::signal(SIGINT, onSignal);
				std::signal(SIGTERM, onSignal);
				QTimer signalTimer;
				QObject::connect(&signalTimer, &QTimer::timeout, &app, [] {
						if (g_stopRequested) QCoreApplication::quit();
				});
				signalTimer.start(200);

				QObject::connect(&app, &QCoreApplication::aboutToQuit, [&] {
						frameTimer.stop();
						SystemLogger::info("APP", "aboutToQuit");
						pipeline.shutdown();
				});

				const int rc = app.exec();
				SystemLogger::shutdown();
				Logger::uninstall();
				return rc;
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return -1;
}
