#include "Sequence/SequenceArtifact.hpp"
#include "dmxseq/Sequence/SequenceCompiler.hpp"

#include <gtest/gtest.h>

using namespace dmxseq::sequence;

namespace{

Sequence sampleSequence(){
  Sequence seq;
  seq.name = "sample";
  seq.source = "write_dmx(7, 70)\nsleep(1.5)\nplay_sound('x.wav', 0.25)\nwait_for_sound()\nstop_sound()";
  seq.commands = {
    Command::writeDmx(7, 70, 1),
    Command::sleep(1.5, 2),
    Command::playSound("x.wav", 0.25f, 3),
    Command::waitForSound(4),
    Command::stopSound(5),
  };
  return seq;
}

} // namespace

TEST(SequenceArtifactTest, EncodedArtifactDecodesToSameCommands){
  Sequence seq = sampleSequence();
  std::string json;
  ASSERT_TRUE(artifact::encode(seq, &json));

  Sequence decoded;
  std::string error;
  ASSERT_TRUE(artifact::decode(json, &decoded, &error)) << error;
  EXPECT_EQ(seq.name, decoded.name);
  EXPECT_EQ(seq.source, decoded.source);
  EXPECT_EQ(seq.commands, decoded.commands);

  std::string source;
  ASSERT_TRUE(artifact::decodeSource(json, &source, &error));
  EXPECT_EQ(seq.source, source);
}

TEST(SequenceArtifactTest, RejectsWrongFormatVersion){
  std::string error;
  Sequence seq;
  EXPECT_FALSE(artifact::decode("{\"format\":2,\"source\":\"\",\"commands\":[]}", &seq, &error));
  EXPECT_EQ("unsupported artifact format", error);
}

TEST(SequenceArtifactTest, RejectsMissingPieces){
  std::string error;
  Sequence seq;
  EXPECT_FALSE(artifact::decode("[]", &seq, &error));
  EXPECT_FALSE(artifact::decode("{\"format\":1,\"commands\":[]}", &seq, &error));
  EXPECT_EQ("source text missing", error);
  EXPECT_FALSE(artifact::decode("{\"format\":1,\"source\":\"\"}", &seq, &error));
  EXPECT_EQ("command list missing", error);
}

TEST(SequenceArtifactTest, RejectsUnknownOrMalformedCommands){
  std::string error;
  Sequence seq;
  EXPECT_FALSE(artifact::decode(
    "{\"format\":1,\"source\":\"\",\"commands\":[{\"op\":\"exec\",\"line\":1}]}", &seq, &error));
  EXPECT_EQ("unknown command", error);

  EXPECT_FALSE(artifact::decode(
    "{\"format\":1,\"source\":\"\",\"commands\":[{\"op\":\"write_dmx\",\"line\":1,\"address\":1.5,\"value\":3}]}",
    &seq, &error));

  EXPECT_FALSE(artifact::decode(
    "{\"format\":1,\"source\":\"\",\"commands\":[{\"op\":\"sleep\",\"line\":2,\"seconds\":-4}]}", &seq, &error));
  EXPECT_EQ("operand out of range on line 2", error);
}
