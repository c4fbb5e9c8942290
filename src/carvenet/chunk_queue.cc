#include "carvenet/chunk_queue.h"

#include <utility>

namespace carvenet {

ChunkQueue::ChunkQueue(std::vector<ChunkDescriptor> plan)
    : plan_(std::move(plan))
    , states_(plan_.size(), ChunkState::Pending)
{
}


bool
ChunkQueue::next(ChunkDescriptor* out)
{
    if (!out) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    while (next_ < plan_.size() && states_[next_] != ChunkState::Pending) {
        next_ += 1U;
    }
    if (next_ >= plan_.size()) {
        return false;
    }
    states_[next_] = ChunkState::Assigned;
    *out           = plan_[next_];
    next_ += 1U;
    return true;
}


bool
ChunkQueue::transition(uint32_t chunk_index, ChunkState from, ChunkState to)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunk_index >= states_.size() || states_[chunk_index] != from) {
        return false;
    }
    states_[chunk_index] = to;
    settled_ += 1U;
    return true;
}


bool
ChunkQueue::mark_collected(uint32_t chunk_index)
{
    return transition(chunk_index, ChunkState::Assigned,
                      ChunkState::Collected);
}


bool
ChunkQueue::mark_failed(uint32_t chunk_index)
{
    return transition(chunk_index, ChunkState::Assigned, ChunkState::Failed);
}


std::vector<uint32_t>
ChunkQueue::fail_pending()
{
    std::vector<uint32_t> failed;
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < states_.size(); ++i) {
        if (states_[i] == ChunkState::Pending) {
            states_[i] = ChunkState::Failed;
            settled_ += 1U;
            failed.push_back(static_cast<uint32_t>(i));
        }
    }
    next_ = states_.size();
    return failed;
}


ChunkState
ChunkQueue::state(uint32_t chunk_index) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunk_index >= states_.size()) {
        return ChunkState::Failed;
    }
    return states_[chunk_index];
}


uint32_t
ChunkQueue::total() const noexcept
{
    return static_cast<uint32_t>(plan_.size());
}


uint32_t
ChunkQueue::pending_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t n = 0;
    for (size_t i = next_; i < states_.size(); ++i) {
        if (states_[i] == ChunkState::Pending) {
            n += 1U;
        }
    }
    return n;
}


uint32_t
ChunkQueue::collected_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t n = 0;
    for (const ChunkState s : states_) {
        if (s == ChunkState::Collected) {
            n += 1U;
        }
    }
    return n;
}


uint32_t
ChunkQueue::resolved_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settled_;
}


bool
ChunkQueue::all_resolved() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settled_ == states_.size();
}


std::vector<uint32_t>
ChunkQueue::missing_chunks() const
{
    std::vector<uint32_t> missing;
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < states_.size(); ++i) {
        if (states_[i] != ChunkState::Collected) {
            missing.push_back(static_cast<uint32_t>(i));
        }
    }
    return missing;
}


const char*
chunk_state_name(ChunkState state) noexcept
{
    switch (state) {
    case ChunkState::Pending: return "pending";
    case ChunkState::Assigned: return "assigned";
    case ChunkState::Collected: return "collected";
    case ChunkState::Failed: return "failed";
    }
    return "unknown";
}

}  // namespace carvenet
