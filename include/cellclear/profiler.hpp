#ifndef CELLCLEAR_PROFILER_HPP
#define CELLCLEAR_PROFILER_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

// Profiling is switched on by the CELLCLEAR_PROFILING compile definition (CMake option)
#ifdef CELLCLEAR_PROFILING
#define PROFILE_FUNCTION() cellclear::ScopedTimer _timer(__FUNCTION__)
#define PROFILE_SCOPE(name) cellclear::ScopedTimer _timer(name)
#else
#define PROFILE_FUNCTION()
#define PROFILE_SCOPE(name)
#endif

namespace cellclear {

struct TimingData {
    double total_time_ms;
    int call_count;
    int depth;
    std::vector<std::string> children;  // Call paths of children
    double min_time_ms;
    double max_time_ms;
    std::string display_name;  // Simple name for display (without path)
    std::string parent_path;   // Full path of parent for hierarchy
};

class Profiler {
   public:
    static Profiler& getInstance();

    void startSection(const std::string& name);
    void endSection(const std::string& name);
    void report(std::ostream& out) const;
    void reset();

    double getTotalTime() const;
    // Aggregated data of one call path ("solve/round"), nullptr if it never ran
    const TimingData* find(const std::string& call_path) const;

   private:
    Profiler() : total_program_time_ms_(0.0) {}
    ~Profiler() = default;

    // Prevent copying
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    struct SectionTimer {
        std::string name;       // Display name
        std::string call_path;  // Full call path for unique identification
        std::chrono::steady_clock::time_point start_time;
        int depth;
    };

    std::map<std::string, TimingData> timings_;  // Key is call_path, not just name
    double total_program_time_ms_;

    // Thread safety
    mutable std::mutex timings_mutex_;

    // Per-thread timer stacks (for OpenMP support)
    std::map<int, std::vector<SectionTimer>> thread_timer_stacks_;

    void printSection(std::ostream& out, const std::string& call_path, std::string prefix, bool last) const;
};

// RAII timer class for automatic scope-based timing
class ScopedTimer {
   public:
    explicit ScopedTimer(const std::string& name) : name_(name) { Profiler::getInstance().startSection(name_); }

    ~ScopedTimer() { Profiler::getInstance().endSection(name_); }

   private:
    std::string name_;
};

}  // namespace cellclear

#endif  // CELLCLEAR_PROFILER_HPP
