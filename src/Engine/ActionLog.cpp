/*****************************************************************
 * File:      ActionLog.cpp
 * Category:  src/Engine
 *
 * Purpose:
 *    Ring-buffer action log.
 *****************************************************************/

#include "dmxseq/Engine/ActionLog.hpp"

#include <utility>

namespace dmxseq::engine{

const char* actionCategoryToString(ActionCategory category){
  switch(category){
    case ActionCategory::DMX:      return "dmx";
    case ActionCategory::SOUND:    return "sound";
    case ActionCategory::SLEEP:    return "sleep";
    case ActionCategory::SEQUENCE: return "sequence";
    case ActionCategory::LOOP:     return "loop";
    case ActionCategory::SYSTEM:   return "system";
    case ActionCategory::ERROR:    return "error";
    default:                       return "unknown";
  }
}

std::string ActionLogEntry::field(const char* key) const{
  for(const ActionField& f : payload){
    if(f.key == key) return f.value;
  }
  return "";
}

ActionLog::ActionLog(hal::IHalSystemTimer* timer, size_t capacity)
  : timer_(timer), ring_(capacity == 0 ? 1 : capacity){}

uint64_t ActionLog::append(ActionCategory category, const std::string& message,
                           const std::vector<ActionField>& payload){
  std::lock_guard<std::mutex> lock(mutex_);
  return appendLocked(category, message, payload);
}

std::vector<ActionLogEntry> ActionLog::getRecent(size_t n) const{
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<ActionLogEntry> out;
  size_t take = n < count_ ? n : count_;
  out.reserve(take);
  for(size_t i = count_ - take; i < count_; i++){
    out.push_back(at(i));
  }
  return out;
}

std::vector<ActionLogEntry> ActionLog::getSince(uint64_t last_id) const{
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<ActionLogEntry> out;
  for(size_t i = 0; i < count_; i++){
    const ActionLogEntry& entry = at(i);
    if(entry.id > last_id) out.push_back(entry);
  }
  return out;
}

void ActionLog::clear(){
  std::lock_guard<std::mutex> lock(mutex_);
  head_ = 0;
  count_ = 0;
  appendLocked(ActionCategory::SYSTEM, "Action log cleared", {});
}

size_t ActionLog::size() const{
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

uint64_t ActionLog::lastId() const{
  std::lock_guard<std::mutex> lock(mutex_);
  return next_id_ - 1;
}

const ActionLogEntry& ActionLog::at(size_t index) const{
  return ring_[(head_ + index) % ring_.size()];
}

uint64_t ActionLog::appendLocked(ActionCategory category, const std::string& message,
                                 const std::vector<ActionField>& payload){
  ActionLogEntry entry;
  entry.id = next_id_++;
  entry.timestamp = timer_ ? timer_->millis() : 0;
  entry.category = category;
  entry.message = message;
  entry.payload = payload;

  if(count_ < ring_.size()){
    ring_[(head_ + count_) % ring_.size()] = std::move(entry);
    count_++;
  }else{
    // Full: overwrite the oldest
    ring_[head_] = std::move(entry);
    head_ = (head_ + 1) % ring_.size();
  }
  return next_id_ - 1;
}

} // namespace dmxseq::engine
