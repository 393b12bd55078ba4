#pragma once

#include "spawn/Interface.hxx"
#include "spawn/ProcessHandle.hxx"
#include "spawn/ExitListener.hxx"
#include "spawn/Prepared.hxx"
#include "event/FineTimerEvent.hxx"

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <signal.h>

/**
 * How a fake child process behaves.
 */
struct FakeBehavior {
	/**
	 * Exit after this duration.
	 */
	Event::Duration runtime = std::chrono::milliseconds(5);

	/**
	 * The wait() status reported after #runtime.
	 */
	int status = 0;

	bool ignore_sigterm = false;

	/**
	 * Let SpawnChildProcess() throw.
	 */
	bool fail_spawn = false;
};

/**
 * What happened to one fake child process.
 */
struct FakeProcess {
	std::string name;
	std::vector<std::string> args;
	std::vector<int> signals;
	bool alive = true;

	bool HasSignal(int signo) const noexcept {
		return std::find(signals.begin(), signals.end(), signo) != signals.end();
	}
};

/**
 * A #SpawnService which does not start processes; each "process"
 * is a timer which reports an exit status.
 */
class FakeSpawnService final : public SpawnService {
	EventLoop &event_loop;

	class Handle;

public:
	FakeBehavior default_behavior;
	std::map<std::string, FakeBehavior, std::less<>> behaviors;

	std::deque<FakeProcess> processes;

	std::size_t n_alive = 0, max_alive = 0;

	explicit FakeSpawnService(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	const FakeBehavior &GetBehavior(std::string_view name) const noexcept {
		if (auto i = behaviors.find(name); i != behaviors.end())
			return i->second;

		return default_behavior;
	}

	std::unique_ptr<ChildProcessHandle> SpawnChildProcess(std::string_view name,
							      PreparedChildProcess &&params) override;

private:
	void OnExit(FakeProcess &process) noexcept {
		if (process.alive) {
			process.alive = false;
			--n_alive;
		}
	}
};

class FakeSpawnService::Handle final : public ChildProcessHandle {
	FakeSpawnService &service;
	FakeProcess &process;
	const FakeBehavior behavior;

	FineTimerEvent exit_timer;

	ExitListener *listener = nullptr;

	int status;

public:
	Handle(FakeSpawnService &_service, FakeProcess &_process,
	       const FakeBehavior &_behavior) noexcept
		:service(_service), process(_process), behavior(_behavior),
		 exit_timer(service.event_loop, BIND_THIS_METHOD(OnExitTimer)),
		 status(behavior.status)
	{
		exit_timer.Schedule(behavior.runtime);
	}

	~Handle() noexcept override {
		/* like the real spawner, an abandoned child is killed */
		service.OnExit(process);
	}

	void SetExitListener(ExitListener &_listener) noexcept override {
		listener = &_listener;
	}

	void Kill(int signo) noexcept override {
		process.signals.push_back(signo);

		if (signo == SIGTERM && behavior.ignore_sigterm)
			return;

		/* wait() status of a process killed by a signal */
		status = signo;
		exit_timer.Schedule(Event::Duration::zero());
	}

private:
	void OnExitTimer() noexcept {
		service.OnExit(process);

		/* this may destroy the handle */
		if (listener != nullptr)
			listener->OnChildProcessExit(status);
	}
};

inline std::unique_ptr<ChildProcessHandle>
FakeSpawnService::SpawnChildProcess(std::string_view name,
				    PreparedChildProcess &&params)
{
	const auto &behavior = GetBehavior(name);
	if (behavior.fail_spawn)
		throw std::runtime_error{"Fake spawn failure"};

	auto &process = processes.emplace_back();
	process.name = name;
	for (const char *arg : params.args)
		process.args.emplace_back(arg);

	max_alive = std::max(max_alive, ++n_alive);

	return std::make_unique<Handle>(*this, process, behavior);
}
