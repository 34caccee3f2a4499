#include "cellclear/profiler.hpp"

#include <omp.h>

#include <algorithm>
#include <iomanip>
#include <iostream>

using namespace std;

namespace cellclear {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const string& name) {
    int thread_id = omp_get_thread_num();

    lock_guard<mutex> lock(timings_mutex_);

    auto& timer_stack = thread_timer_stacks_[thread_id];

    // Build call path: parent_path/name
    string call_path;
    string parent_path;
    if (!timer_stack.empty()) {
        parent_path = timer_stack.back().call_path;
        call_path = parent_path + "/" + name;
    } else {
        call_path = name;  // Root level
    }

    int depth = static_cast<int>(timer_stack.size());
    if (timings_.find(call_path) == timings_.end()) {
        timings_[call_path] = {0.0, 0, depth, {}, 1e9, 0.0, name, parent_path};
    }

    // Track parent-child relationships using call paths
    if (!parent_path.empty()) {
        auto& parent_children = timings_[parent_path].children;
        if (std::find(parent_children.begin(), parent_children.end(), call_path) == parent_children.end()) {
            parent_children.push_back(call_path);
        }
    }

    timer_stack.push_back({name, call_path, chrono::steady_clock::now(), depth});
}

void Profiler::endSection(const string& name) {
    auto end_time = chrono::steady_clock::now();
    int thread_id = omp_get_thread_num();

    lock_guard<mutex> lock(timings_mutex_);

    auto& timer_stack = thread_timer_stacks_[thread_id];
    if (timer_stack.empty()) {
        cerr << "Profiler error: endSection called without matching startSection for " << name << "\n";
        return;
    }

    const SectionTimer& timer = timer_stack.back();
    if (timer.name != name) {
        cerr << "Profiler error: endSection name mismatch. Expected " << timer.name << ", got " << name << "\n";
        return;
    }

    auto duration = chrono::duration_cast<chrono::microseconds>(end_time - timer.start_time);
    double duration_ms = duration.count() / 1000.0;

    TimingData& data = timings_[timer.call_path];
    data.total_time_ms += duration_ms;
    data.call_count++;
    data.min_time_ms = min(data.min_time_ms, duration_ms);
    data.max_time_ms = max(data.max_time_ms, duration_ms);

    timer_stack.pop_back();

    // Track total program time from root sections
    if (timer_stack.empty()) total_program_time_ms_ += duration_ms;
}

void Profiler::printSection(ostream& out, const string& call_path, string prefix, bool last) const {
    auto it = timings_.find(call_path);
    if (it == timings_.end()) return;

    const TimingData& data = it->second;

    double percent_of_total =
        total_program_time_ms_ > 0 ? (data.total_time_ms / total_program_time_ms_ * 100.0) : 0.0;
    double avg_time_ms = data.call_count > 0 ? (data.total_time_ms / data.call_count) : 0.0;
    double min_time_ms = data.call_count > 0 ? data.min_time_ms : 0.0;

    string local_prefix = prefix + (last ? "└─ " : "├─ ");
    // clang-format off
    out << left
        << local_prefix
        << setw(max(10, 40 - (data.depth + 1) * 3)) << data.display_name
        << right
        << setw(12) << fixed << setprecision(2) << data.total_time_ms
        << setw(12) << fixed << setprecision(2) << min_time_ms
        << setw(12) << fixed << setprecision(2) << data.max_time_ms
        << setw(9) << fixed << setprecision(1) << percent_of_total << "%"
        << setw(10) << data.call_count
        << setw(14) << fixed << setprecision(3) << avg_time_ms
        << "\n";
    // clang-format on

    for (size_t i = 0; i < data.children.size(); ++i) {
        bool last_child = (i == data.children.size() - 1);
        printSection(out, data.children[i], prefix + (last ? "   " : "│  "), last_child);
    }
}

void Profiler::report(ostream& out) const {
    lock_guard<mutex> lock(timings_mutex_);

    // clang-format off
    out << "\n";
    out << "==============================================================================================================\n";
    out << "PROFILING REPORT | OMP Threads: " << omp_get_max_threads() << "\n";
    out << "==============================================================================================================\n";
    out << left
        << setw(40) << "Section"
        << right
        << setw(12) << "Total(ms)"
        << setw(12) << "Min(ms)"
        << setw(12) << "Max(ms)"
        << setw(10) << "Total%"
        << setw(10) << "Calls"
        << setw(14) << "Avg(ms/call)"
        << "\n";
    out << "--------------------------------------------------------------------------------------------------------------\n";
    // clang-format on

    vector<string> root_sections;
    for (const auto& entry : timings_) {
        if (entry.second.depth == 0) root_sections.push_back(entry.first);
    }
    for (size_t i = 0; i < root_sections.size(); ++i) {
        printSection(out, root_sections[i], "", i == root_sections.size() - 1);
    }

    out << "--------------------------------------------------------------------------------------------------------------\n";
    out << "Total measured time: " << fixed << setprecision(2) << total_program_time_ms_ << " ms\n";
    out << "==============================================================================================================\n\n";
}

void Profiler::reset() {
    lock_guard<mutex> lock(timings_mutex_);
    timings_.clear();
    thread_timer_stacks_.clear();
    total_program_time_ms_ = 0.0;
}

double Profiler::getTotalTime() const {
    lock_guard<mutex> lock(timings_mutex_);
    return total_program_time_ms_;
}

const TimingData* Profiler::find(const string& call_path) const {
    lock_guard<mutex> lock(timings_mutex_);
    auto it = timings_.find(call_path);
    return it == timings_.end() ? nullptr : &it->second;
}

}  // namespace cellclear
