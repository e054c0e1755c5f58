#include "Trace.h"

#include <fstream>

namespace diag {
	void TraceCollector::record(const TraceEvent& ev) {
		if (!enabled_) return;
		if (events_.size() >= capacity_) {
			++dropped_;
			return;
		}
		events_.push_back(ev);
	}

	TraceCollector& Traces() {
		static TraceCollector collector;
		return collector;
	}

	ScopedCpuZone::ScopedCpuZone(const char* name)
		: name_(name) {
		Traces().record(TraceEvent{ name_, EventType::Begin, now_ns() });
	}

	ScopedCpuZone::~ScopedCpuZone() {
		Traces().record(TraceEvent{ name_, EventType::End, now_ns() });
	}

	void Mark(const char* name) {
		Traces().record(TraceEvent{ name, EventType::Instant, now_ns() });
	}

	static const char* phase(EventType t) {
		switch (t) {
		case EventType::Begin: return "B";
		case EventType::End: return "E";
		case EventType::Instant: return "i";
		}
		return "i";
	}

	bool WriteChromeTraceJSON(const TraceCollector& tc, const std::string& path) {
		std::ofstream out(path, std::ios::binary);
		if (!out) return false;

		const auto& evs = tc.events();
		const int64_t origin = evs.empty() ? 0 : evs.front().ts_ns;

		out << "{ \"traceEvents\":[\n";
		for (size_t i = 0; i < evs.size(); ++i) {
			const auto& e = evs[i];
			out << " {\"name\":\"" << (e.name ? e.name : "?")
				<< "\",\"ph\":\"" << phase(e.type)
				<< "\",\"ts\":" << ((e.ts_ns - origin) / 1000)
				<< ",\"pid\":1,\"tid\":1";
			if (e.type == EventType::Instant) out << ",\"s\":\"t\"";
			out << "}";
			if (i + 1 < evs.size()) out << ",\n";
		}
		out << "\n], \"displayTimeUnit\":\"ms\" }\n";
		return static_cast<bool>(out);
	}
}
