/*****************************************************************
 * File:      IHalAudio.hpp
 * Category:  include/dmxseq/HAL
 *
 * Purpose:
 *    Audio player abstraction consumed by the execution engine.
 *    One clip plays at a time; play() returns as soon as
 *    playback has started.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_HAL_IHAL_AUDIO_HPP_
#define DMXSEQ_INCLUDE_HAL_IHAL_AUDIO_HPP_

#include "HalTypes.hpp"

namespace dmxseq::hal{

// ============================================================
// Audio Player Interface
// ============================================================

/** Asynchronous audio player
 *
 * Implementations must be safe to query with isPlaying() from
 * any thread while playback runs in the background.
 */
class IHalAudioPlayer{
public:
  virtual ~IHalAudioPlayer() = default;

  /** Start playback of a file, replacing any clip already playing
   * @param path Absolute path of the audio file
   * @param volume Linear gain in [0.0, 1.0]
   * @return HalResult::OK once playback has started
   *         HalResult::KEY_NOT_FOUND if the file does not exist
   *         HalResult::NOT_SUPPORTED if the format cannot be decoded
   */
  virtual HalResult play(const char* path, float volume) = 0;

  /** Stop playback. No-op when idle.
   * @return HalResult::OK on success
   */
  virtual HalResult stop() = 0;

  /** Check whether a clip is still playing
   * @return true while audio is being output
   */
  virtual bool isPlaying() const = 0;
};

} // namespace dmxseq::hal

#endif // DMXSEQ_INCLUDE_HAL_IHAL_AUDIO_HPP_
