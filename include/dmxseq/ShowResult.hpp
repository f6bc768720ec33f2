/*****************************************************************
 * File:      ShowResult.hpp
 * Category:  include/dmxseq
 *
 * Purpose:
 *    Result codes for show-level operations (compiler,
 *    persistence, engine and control surface).
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_SHOW_RESULT_HPP_
#define DMXSEQ_INCLUDE_SHOW_RESULT_HPP_

#include <stdint.h>

namespace dmxseq{

/** Show operation result codes */
enum class ShowResult : uint8_t{
  OK = 0,              // Operation successful
  ALREADY_RUNNING,     // A show is already running
  NOT_FOUND,           // Sequence does not exist
  INVALID_NAME,        // Sequence name rejected
  VALIDATION_FAILED,   // Source has errors, nothing persisted
  CORRUPT_ARTIFACT,    // Persisted sequence cannot be decoded
  IO_ERROR,            // Filesystem failure
  BUSY,                // Resource held by a running show
  INVALID_PARAM        // Invalid parameter
};

/** Convert ShowResult to string */
inline const char* showResultToString(ShowResult result){
  switch(result){
    case ShowResult::OK:                return "OK";
    case ShowResult::ALREADY_RUNNING:   return "ALREADY_RUNNING";
    case ShowResult::NOT_FOUND:         return "NOT_FOUND";
    case ShowResult::INVALID_NAME:      return "INVALID_NAME";
    case ShowResult::VALIDATION_FAILED: return "VALIDATION_FAILED";
    case ShowResult::CORRUPT_ARTIFACT:  return "CORRUPT_ARTIFACT";
    case ShowResult::IO_ERROR:          return "IO_ERROR";
    case ShowResult::BUSY:              return "BUSY";
    case ShowResult::INVALID_PARAM:     return "INVALID_PARAM";
    default:                            return "UNKNOWN";
  }
}

} // namespace dmxseq

#endif // DMXSEQ_INCLUDE_SHOW_RESULT_HPP_
