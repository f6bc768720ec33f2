/*****************************************************************
 * File:      SequenceArtifact.hpp
 * Category:  src/Sequence
 *
 * Purpose:
 *    JSON encoding of persisted sequences (cJSON).
 *
 *    {"format":1,"name":"intro","source":"...",
 *     "commands":[{"op":"write_dmx","line":1,"address":1,"value":255},
 *                 {"op":"sleep","line":2,"seconds":0.5},
 *                 {"op":"play_sound","line":3,"file":"a.wav","volume":0.8},
 *                 {"op":"wait_for_sound","line":4}]}
 *****************************************************************/

#ifndef DMXSEQ_SRC_SEQUENCE_SEQUENCE_ARTIFACT_HPP_
#define DMXSEQ_SRC_SEQUENCE_SEQUENCE_ARTIFACT_HPP_

#include "dmxseq/Sequence/Command.hpp"

#include <string>

namespace dmxseq::sequence::artifact{

/** Serialize a sequence
 * @param out Receives the JSON document
 * @return false if cJSON ran out of memory
 */
bool encode(const Sequence& sequence, std::string* out);

/** Parse a sequence, checking every command's operands
 * @param json Artifact text
 * @param out Receives the sequence
 * @param error Receives a short reason on failure
 * @return true when the artifact is well formed
 */
bool decode(const std::string& json, Sequence* out, std::string* error);

/** Extract only the source text */
bool decodeSource(const std::string& json, std::string* source, std::string* error);

} // namespace dmxseq::sequence::artifact

#endif // DMXSEQ_SRC_SEQUENCE_SEQUENCE_ARTIFACT_HPP_
