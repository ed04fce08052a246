/**
 * @file concurrency_gate.cpp
 * @brief ConcurrencyGate and GatePermit implementation.
 */

#include "gate/concurrency_gate.hpp"

#include <algorithm>
#include <utility>

namespace jobguard {

// ─────────────────────────────────────────────
// GatePermit
// ─────────────────────────────────────────────

GatePermit::~GatePermit() {
    release();
}

GatePermit::GatePermit(GatePermit&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)),
      job_(std::move(other.job_)),
      worker_(std::exchange(other.worker_, 0)) {}

GatePermit& GatePermit::operator=(GatePermit&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
        job_ = std::move(other.job_);
        worker_ = std::exchange(other.worker_, 0);
    }
    return *this;
}

void GatePermit::bind_worker(pid_t pid) {
    if (gate_ == nullptr || pid <= 0) return;
    worker_ = pid;
    gate_->bind(job_, pid);
}

void GatePermit::release() noexcept {
    if (auto* gate = std::exchange(gate_, nullptr)) {
        gate->release(job_, std::exchange(worker_, 0));
    }
}

// ─────────────────────────────────────────────
// ConcurrencyGate
// ─────────────────────────────────────────────

void ConcurrencyGate::configure(const JobName& job, uint32_t limit) {
    auto& s = slot(job);
    std::lock_guard lock(s.mutex);
    s.limit = std::max<uint32_t>(limit, 1);
}

std::optional<GatePermit> ConcurrencyGate::try_acquire(const JobName& job) {
    auto& s = slot(job);
    std::lock_guard lock(s.mutex);
    if (s.in_flight >= s.limit) {
        return std::nullopt;
    }
    ++s.in_flight;
    return GatePermit{this, job};
}

uint32_t ConcurrencyGate::in_flight(const JobName& job) const {
    const auto* s = find(job);
    if (s == nullptr) return 0;
    std::lock_guard lock(s->mutex);
    return s->in_flight;
}

uint32_t ConcurrencyGate::limit(const JobName& job) const {
    const auto* s = find(job);
    if (s == nullptr) return 1;
    std::lock_guard lock(s->mutex);
    return s->limit;
}

std::vector<pid_t> ConcurrencyGate::active_workers(const JobName& job) const {
    const auto* s = find(job);
    if (s == nullptr) return {};
    std::lock_guard lock(s->mutex);
    return s->workers;
}

uint32_t ConcurrencyGate::total_in_flight() const {
    std::shared_lock lock(slots_mutex_);
    uint32_t total = 0;
    for (const auto& [name, s] : slots_) {
        std::lock_guard slot_lock(s->mutex);
        total += s->in_flight;
    }
    return total;
}

ConcurrencyGate::Slot& ConcurrencyGate::slot(const JobName& job) {
    {
        std::shared_lock lock(slots_mutex_);
        if (auto it = slots_.find(job); it != slots_.end()) return *it->second;
    }
    std::unique_lock lock(slots_mutex_);
    auto [it, inserted] = slots_.try_emplace(job, nullptr);
    if (inserted) it->second = std::make_unique<Slot>();
    return *it->second;
}

ConcurrencyGate::Slot* ConcurrencyGate::find(const JobName& job) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(job);
    return it == slots_.end() ? nullptr : it->second.get();
}

void ConcurrencyGate::bind(const JobName& job, pid_t pid) {
    auto& s = slot(job);
    std::lock_guard lock(s.mutex);
    s.workers.push_back(pid);
}

void ConcurrencyGate::release(const JobName& job, pid_t pid) noexcept {
    auto* s = find(job);
    if (s == nullptr) return;
    std::lock_guard lock(s->mutex);
    if (s->in_flight > 0) --s->in_flight;
    if (pid > 0) {
        auto it = std::find(s->workers.begin(), s->workers.end(), pid);
        if (it != s->workers.end()) s->workers.erase(it);
    }
}

}  // namespace jobguard
