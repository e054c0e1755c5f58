#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace diag {
	enum class EventType : uint8_t {Begin, End, Instant};

	struct TraceEvent {
		const char* name;
		EventType type;
		int64_t ts_ns;
	};

	inline int64_t now_ns() {
		return std::chrono::duration_cast<std::chrono::nanoseconds>(
			std::chrono::steady_clock::now().time_since_epoch()).count();
	}

	// Main-thread event log. Disabled until setEnabled(true); stops recording once full.
	class TraceCollector {
	public:
		explicit TraceCollector(size_t capacity = 1u << 20) : capacity_(capacity) {}

		void setEnabled(bool on) { enabled_ = on; }
		bool enabled() const { return enabled_; }

		void record(const TraceEvent& ev);

		const std::vector<TraceEvent>& events() const { return events_; }
		size_t dropped() const { return dropped_; }
		void clear() { events_.clear(); dropped_ = 0; }

	private:
		size_t capacity_;
		std::vector<TraceEvent> events_;
		size_t dropped_ = 0;
		bool enabled_ = false;
	};

	TraceCollector& Traces();

	class ScopedCpuZone {
	public:
		explicit ScopedCpuZone(const char* name);
		~ScopedCpuZone();

		ScopedCpuZone(const ScopedCpuZone&) = delete;
		ScopedCpuZone& operator=(const ScopedCpuZone&) = delete;
	private:
		const char* name_;
	};

	void Mark(const char* name);

	// Chrome about://tracing / Perfetto JSON. Returns false if the file can't be written.
	bool WriteChromeTraceJSON(const TraceCollector& tc, const std::string& path);
}
