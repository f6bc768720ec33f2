/*****************************************************************
 * File:      ActionLog.hpp
 * Category:  include/dmxseq/Engine
 *
 * Purpose:
 *    Bounded, thread-safe history of show events. The engine
 *    appends from its worker; control surfaces poll or stream
 *    from other threads.
 *
 *    Storage is a fixed ring under a mutex. Readers always get
 *    copies, so a partially written entry is never visible.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_ENGINE_ACTION_LOG_HPP_
#define DMXSEQ_INCLUDE_ENGINE_ACTION_LOG_HPP_

#include "dmxseq/HAL/IHalTimer.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace dmxseq::engine{

// ============================================================
// Entry Types
// ============================================================

enum class ActionCategory : uint8_t{
  DMX,
  SOUND,
  SLEEP,
  SEQUENCE,
  LOOP,
  SYSTEM,
  ERROR
};

const char* actionCategoryToString(ActionCategory category);

/** Key/value detail attached to an entry */
struct ActionField{
  std::string key;
  std::string value;
};

struct ActionLogEntry{
  uint64_t id = 0;                      // Strictly increasing
  hal::timestamp_ms_t timestamp = 0;    // Milliseconds since boot
  ActionCategory category = ActionCategory::SYSTEM;
  std::string message;
  std::vector<ActionField> payload;

  /** Value of a payload field, or "" */
  std::string field(const char* key) const;
};

// ============================================================
// Action Log
// ============================================================

class ActionLog{
public:
  static constexpr size_t DEFAULT_CAPACITY = 100;

  /**
   * @param timer Source of timestamps; entries get 0 when null
   * @param capacity Maximum retained entries (at least 1)
   */
  explicit ActionLog(hal::IHalSystemTimer* timer = nullptr, size_t capacity = DEFAULT_CAPACITY);

  /** Append an entry, evicting the oldest when full
   * @return id assigned to the entry
   */
  uint64_t append(ActionCategory category, const std::string& message,
                  const std::vector<ActionField>& payload = {});

  /** Up to n newest entries, oldest first */
  std::vector<ActionLogEntry> getRecent(size_t n) const;

  /** Entries with id greater than last_id, oldest first */
  std::vector<ActionLogEntry> getSince(uint64_t last_id) const;

  /** Drop all entries, then record the clear itself */
  void clear();

  size_t size() const;
  size_t capacity() const{ return ring_.size(); }

  /** Id of the newest entry, 0 if nothing was ever appended */
  uint64_t lastId() const;

private:
  const ActionLogEntry& at(size_t index) const;   // 0 = oldest, caller holds mutex_
  uint64_t appendLocked(ActionCategory category, const std::string& message,
                        const std::vector<ActionField>& payload);

  hal::IHalSystemTimer* timer_;
  mutable std::mutex mutex_;
  std::vector<ActionLogEntry> ring_;
  size_t head_ = 0;      // Oldest entry
  size_t count_ = 0;
  uint64_t next_id_ = 1;
};

} // namespace dmxseq::engine

#endif // DMXSEQ_INCLUDE_ENGINE_ACTION_LOG_HPP_
