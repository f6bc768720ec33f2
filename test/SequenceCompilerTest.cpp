#include "dmxseq/Sequence/SequenceCompiler.hpp"
#include "support/CaptureLog.hpp"
#include "support/TempDir.hpp"

#include <gtest/gtest.h>
#include <utime.h>

using namespace dmxseq;
using namespace dmxseq::sequence;

namespace{

class SequenceCompilerTest : public ::testing::Test{
protected:
  SequenceCompilerTest() : compiler_(makeConfig(dir_), &log_){}

  static CompilerConfig makeConfig(const test::TempDir& dir){
    CompilerConfig config;
    config.sequences_directory = dir.file("sequences");
    return config;
  }

  bool hasError(const ValidationReport& report, DiagnosticCode code) const{
    for(const Diagnostic& d : report.errors){
      if(d.code == code) return true;
    }
    return false;
  }

  test::TempDir dir_;
  test::CaptureLog log_;
  SequenceCompiler compiler_;
};

} // namespace

// ============================================================
// Validation
// ============================================================

TEST_F(SequenceCompilerTest, AcceptsEveryCommand){
  std::vector<Command> commands;
  ValidationReport report = compiler_.compile(
    "# opening\n"
    "write_dmx(1, 255)\n"
    "sleep(0.5)\n"
    "play_sound('intro.wav', 0.8)\n"
    "wait_for_sound()\n"
    "stop_sound()\n", &commands);

  EXPECT_TRUE(report.isValid());
  EXPECT_TRUE(report.warnings.empty());
  ASSERT_EQ(5u, commands.size());
  EXPECT_EQ(Command::writeDmx(1, 255, 2), commands[0]);
  EXPECT_EQ(Command::sleep(0.5, 3), commands[1]);
  EXPECT_EQ(Command::playSound("intro.wav", 0.8f, 4), commands[2]);
  EXPECT_EQ(Command::waitForSound(5), commands[3]);
  EXPECT_EQ(Command::stopSound(6), commands[4]);
}

TEST_F(SequenceCompilerTest, DmxRangeErrorsCarryLineNumbers){
  ValidationReport report = compiler_.validate("write_dmx(1, 0)\nwrite_dmx(0, 10)\nwrite_dmx(5, 256)\n");
  ASSERT_EQ(2u, report.errors.size());

  EXPECT_EQ(2u, report.errors[0].line);
  EXPECT_EQ(DiagnosticCode::ADDRESS_OUT_OF_RANGE, report.errors[0].code);
  EXPECT_EQ("Line 2: DMX address must be between 1 and 512", report.errors[0].toString());

  EXPECT_EQ(3u, report.errors[1].line);
  EXPECT_EQ(DiagnosticCode::VALUE_OUT_OF_RANGE, report.errors[1].code);
  EXPECT_EQ("DMX value must be between 0 and 255", report.errors[1].message);
}

TEST_F(SequenceCompilerTest, RangeBoundariesAreInclusive){
  EXPECT_TRUE(compiler_.validate("write_dmx(1, 0)\nwrite_dmx(512, 255)\n").isValid());
  EXPECT_FALSE(compiler_.validate("write_dmx(513, 0)").isValid());
  EXPECT_FALSE(compiler_.validate("write_dmx(1, -1)").isValid());
}

TEST_F(SequenceCompilerTest, DmxOperandsMustBeIntegers){
  ValidationReport report = compiler_.validate("write_dmx(1.5, 'x')");
  ASSERT_EQ(2u, report.errors.size());
  EXPECT_EQ(DiagnosticCode::INVALID_ARGUMENT, report.errors[0].code);
  EXPECT_EQ("DMX address must be an integer, got 1.5", report.errors[0].message);
  EXPECT_EQ(DiagnosticCode::INVALID_ARGUMENT, report.errors[1].code);
}

TEST_F(SequenceCompilerTest, SleepBounds){
  ValidationReport report = compiler_.validate("sleep(-1)");
  ASSERT_EQ(1u, report.errors.size());
  EXPECT_EQ(DiagnosticCode::NEGATIVE_SLEEP, report.errors[0].code);
  EXPECT_EQ("Sleep time cannot be negative", report.errors[0].message);

  report = compiler_.validate("sleep(0)");
  EXPECT_TRUE(report.isValid());
  EXPECT_TRUE(report.warnings.empty());

  report = compiler_.validate("sleep(3600)");
  EXPECT_TRUE(report.warnings.empty());

  report = compiler_.validate("sleep(7200)");
  EXPECT_TRUE(report.isValid());
  ASSERT_EQ(1u, report.warnings.size());
  EXPECT_EQ(DiagnosticCode::LONG_SLEEP, report.warnings[0].code);
  EXPECT_EQ("Sleep time is very long (7200s)", report.warnings[0].message);
}

TEST_F(SequenceCompilerTest, PlaySoundChecks){
  ValidationReport report = compiler_.validate("play_sound()");
  ASSERT_EQ(1u, report.errors.size());
  EXPECT_EQ("play_sound() requires 1-2 arguments", report.errors[0].message);

  report = compiler_.validate("play_sound(5)");
  EXPECT_EQ("Sound filename must be a string", report.errors.at(0).message);

  report = compiler_.validate("play_sound('')");
  EXPECT_EQ("Sound filename cannot be empty", report.errors.at(0).message);

  report = compiler_.validate("play_sound('a.wav', 1.5)");
  EXPECT_EQ(DiagnosticCode::VOLUME_OUT_OF_RANGE, report.errors.at(0).code);
  EXPECT_EQ("Volume must be between 0.0 and 1.0", report.errors.at(0).message);

  report = compiler_.validate("play_sound('a.WAV', 0)\nplay_sound('b.mp3', 1)");
  EXPECT_TRUE(report.isValid());
  EXPECT_TRUE(report.warnings.empty());
}

TEST_F(SequenceCompilerTest, UnsupportedFormatIsOnlyAWarning){
  std::vector<Command> commands;
  ValidationReport report = compiler_.compile("play_sound('clip.aiff')", &commands);
  EXPECT_TRUE(report.isValid());
  ASSERT_EQ(1u, report.warnings.size());
  EXPECT_EQ("Unsupported sound format: clip.aiff", report.warnings[0].message);
  ASSERT_EQ(1u, commands.size());
  EXPECT_FLOAT_EQ(1.0f, commands[0].volume);
}

TEST_F(SequenceCompilerTest, UnknownFunctionWarnsAndIsSkipped){
  std::vector<Command> commands;
  ValidationReport report = compiler_.compile("write_dmx(1, 1)\nblink(3)\nsleep(1)", &commands);
  EXPECT_TRUE(report.isValid());
  ASSERT_EQ(1u, report.warnings.size());
  EXPECT_EQ(2u, report.warnings[0].line);
  EXPECT_EQ("Unknown function: blink", report.warnings[0].message);
  ASSERT_EQ(2u, commands.size());
  EXPECT_EQ(CommandOp::SLEEP, commands[1].op);
}

TEST_F(SequenceCompilerTest, NoArgumentCommandsRejectArguments){
  ValidationReport report = compiler_.validate("stop_sound(1)\nwait_for_sound('x')");
  ASSERT_EQ(2u, report.errors.size());
  EXPECT_EQ("stop_sound() takes no arguments", report.errors[0].message);
  EXPECT_EQ("wait_for_sound() takes no arguments", report.errors[1].message);
}

TEST_F(SequenceCompilerTest, LoopsAreRejected){
  ValidationReport report = compiler_.validate("for i in range(3):\n    write_dmx(i, 255)\n");
  ASSERT_EQ(2u, report.errors.size());
  EXPECT_EQ(DiagnosticCode::INVALID_CALL, report.errors[0].code);
  EXPECT_EQ("Invalid function call: for i in range(3):", report.errors[0].message);
  EXPECT_EQ(DiagnosticCode::INVALID_ARGUMENT, report.errors[1].code);
  EXPECT_EQ(2u, report.errors[1].line);
}

TEST_F(SequenceCompilerTest, ValidationIsDeterministic){
  const std::string text = "write_dmx(0, 1)\nsleep(-2)\nfoo()\nplay_sound('x.aiff', 2)\n";
  ValidationReport a = compiler_.validate(text);
  ValidationReport b = compiler_.validate(text);
  ASSERT_EQ(a.errors.size(), b.errors.size());
  ASSERT_EQ(a.warnings.size(), b.warnings.size());
  for(size_t i = 0; i < a.errors.size(); i++){
    EXPECT_EQ(a.errors[i].toString(), b.errors[i].toString());
  }
}

TEST_F(SequenceCompilerTest, RejectsOversizedAndBinaryInput){
  CompilerConfig config = compiler_.getConfig();
  config.max_sequence_size = 16;
  SequenceCompiler small(config);

  ValidationReport report = small.validate("write_dmx(1, 255)\nsleep(1)\n");
  ASSERT_EQ(1u, report.errors.size());
  EXPECT_EQ(0u, report.errors[0].line);
  EXPECT_EQ(DiagnosticCode::INPUT_REJECTED, report.errors[0].code);

  report = compiler_.validate(std::string("sleep(1)\0", 9));
  ASSERT_EQ(1u, report.errors.size());
  EXPECT_EQ(DiagnosticCode::INPUT_REJECTED, report.errors[0].code);
}

TEST_F(SequenceCompilerTest, CompileClearsCommandsOnError){
  std::vector<Command> commands = {Command::stopSound()};
  ValidationReport report = compiler_.compile("write_dmx(1, 1)\nwrite_dmx(1, 999)", &commands);
  EXPECT_FALSE(report.isValid());
  EXPECT_TRUE(commands.empty());
}

// ============================================================
// Persistence
// ============================================================

TEST_F(SequenceCompilerTest, SaveLoadRoundTripKeepsSourceVerbatim){
  const std::string text = "# Show\r\nwrite_dmx(1, 255)   # on\n\n\tsleep(0.25)\nplay_sound(\"a b.wav\", 0.5)\n";
  GenerateResult saved = compiler_.generate("show_1", text);
  ASSERT_EQ(ShowResult::OK, saved.result);

  std::string loaded;
  ASSERT_EQ(ShowResult::OK, compiler_.load("show_1", &loaded));
  EXPECT_EQ(text, loaded);

  Sequence seq;
  ASSERT_EQ(ShowResult::OK, compiler_.loadSequence("show_1", &seq));
  EXPECT_EQ("show_1", seq.name);
  ASSERT_EQ(3u, seq.commands.size());
  EXPECT_EQ(Command::writeDmx(1, 255, 2), seq.commands[0]);
  EXPECT_EQ(Command::sleep(0.25, 4), seq.commands[1]);
  EXPECT_EQ(Command::playSound("a b.wav", 0.5f, 5), seq.commands[2]);
}

TEST_F(SequenceCompilerTest, InvalidSourceIsNeverSaved){
  ASSERT_EQ(ShowResult::OK, compiler_.generate("keep", "write_dmx(1, 10)").result);

  GenerateResult bad = compiler_.generate("keep", "write_dmx(1, 10)\nwrite_dmx(600, 1)");
  EXPECT_EQ(ShowResult::VALIDATION_FAILED, bad.result);
  EXPECT_EQ(1u, bad.report.errors.size());

  std::string text;
  ASSERT_EQ(ShowResult::OK, compiler_.load("keep", &text));
  EXPECT_EQ("write_dmx(1, 10)", text);

  EXPECT_EQ(ShowResult::VALIDATION_FAILED, compiler_.generate("fresh", "sleep(-1)").result);
  EXPECT_FALSE(compiler_.exists("fresh"));
}

TEST_F(SequenceCompilerTest, SaveReplacesWithoutTemporaryLeftovers){
  ASSERT_EQ(ShowResult::OK, compiler_.generate("song", "sleep(1)").result);
  ASSERT_EQ(ShowResult::OK, compiler_.generate("song", "sleep(2)").result);

  std::string text;
  ASSERT_EQ(ShowResult::OK, compiler_.load("song", &text));
  EXPECT_EQ("sleep(2)", text);
  EXPECT_FALSE(test::fileExists(compiler_.artifactPath("song") + ".tmp"));
}

TEST_F(SequenceCompilerTest, RejectsBadNames){
  EXPECT_EQ(ShowResult::INVALID_NAME, compiler_.generate("../escape", "sleep(1)").result);
  EXPECT_EQ(ShowResult::INVALID_NAME, compiler_.generate("", "sleep(1)").result);
  EXPECT_EQ(ShowResult::INVALID_NAME, compiler_.generate(std::string(65, 'a'), "sleep(1)").result);
  EXPECT_TRUE(SequenceCompiler::isValidName(std::string(64, 'a')));
  EXPECT_TRUE(SequenceCompiler::isValidName("Show-2_b"));
  EXPECT_FALSE(SequenceCompiler::isValidName("with space"));

  std::string text;
  EXPECT_EQ(ShowResult::INVALID_NAME, compiler_.load("a/b", &text));
  EXPECT_EQ(ShowResult::INVALID_NAME, compiler_.remove("a.b"));
}

TEST_F(SequenceCompilerTest, MissingSequences){
  std::string text;
  Sequence seq;
  EXPECT_EQ(ShowResult::NOT_FOUND, compiler_.load("ghost", &text));
  EXPECT_EQ(ShowResult::NOT_FOUND, compiler_.loadSequence("ghost", &seq));
  EXPECT_EQ(ShowResult::NOT_FOUND, compiler_.remove("ghost"));
  EXPECT_FALSE(compiler_.exists("ghost"));
}

TEST_F(SequenceCompilerTest, RemoveDeletesArtifact){
  ASSERT_EQ(ShowResult::OK, compiler_.generate("gone", "sleep(1)").result);
  EXPECT_TRUE(compiler_.exists("gone"));
  EXPECT_EQ(ShowResult::OK, compiler_.remove("gone"));
  EXPECT_FALSE(compiler_.exists("gone"));
}

TEST_F(SequenceCompilerTest, ListIsNewestFirst){
  std::vector<SequenceInfo> list;
  EXPECT_EQ(ShowResult::OK, compiler_.list(&list));   // directory not created yet
  EXPECT_TRUE(list.empty());

  ASSERT_EQ(ShowResult::OK, compiler_.generate("old", "sleep(1)").result);
  ASSERT_EQ(ShowResult::OK, compiler_.generate("new", "sleep(1)").result);
  ASSERT_EQ(ShowResult::OK, compiler_.generate("mid", "sleep(1)").result);

  struct utimbuf t;
  t.actime = t.modtime = 1000;
  ASSERT_EQ(0, utime(compiler_.artifactPath("old").c_str(), &t));
  t.actime = t.modtime = 3000;
  ASSERT_EQ(0, utime(compiler_.artifactPath("new").c_str(), &t));
  t.actime = t.modtime = 2000;
  ASSERT_EQ(0, utime(compiler_.artifactPath("mid").c_str(), &t));

  // Stray files are ignored
  ASSERT_TRUE(test::writeFile(dir_.file("sequences/notes.txt"), "hello"));
  ASSERT_TRUE(test::writeFile(dir_.file("sequences/bad name.json"), "{}"));

  ASSERT_EQ(ShowResult::OK, compiler_.list(&list));
  ASSERT_EQ(3u, list.size());
  EXPECT_EQ("new", list[0].name);
  EXPECT_EQ("mid", list[1].name);
  EXPECT_EQ("old", list[2].name);
  EXPECT_EQ(3000, list[0].modified);
  EXPECT_GT(list[0].size, 0u);
}

TEST_F(SequenceCompilerTest, CorruptArtifactIsReported){
  ASSERT_EQ(ShowResult::OK, compiler_.generate("broken", "sleep(1)").result);
  ASSERT_TRUE(test::writeFile(compiler_.artifactPath("broken"), "{ not json"));

  Sequence seq;
  std::string text;
  EXPECT_EQ(ShowResult::CORRUPT_ARTIFACT, compiler_.loadSequence("broken", &seq));
  EXPECT_EQ(ShowResult::CORRUPT_ARTIFACT, compiler_.load("broken", &text));
  EXPECT_TRUE(log_.contains("corrupt"));
}

TEST_F(SequenceCompilerTest, TamperedOperandsAreRejectedAtLoad){
  ASSERT_EQ(ShowResult::OK, compiler_.generate("tampered", "write_dmx(1, 1)").result);
  ASSERT_TRUE(test::writeFile(compiler_.artifactPath("tampered"),
    "{\"format\":1,\"name\":\"tampered\",\"source\":\"write_dmx(1, 1)\","
    "\"commands\":[{\"op\":\"write_dmx\",\"line\":1,\"address\":900,\"value\":1}]}"));

  Sequence seq;
  EXPECT_EQ(ShowResult::CORRUPT_ARTIFACT, compiler_.loadSequence("tampered", &seq));

  // The source text is still readable for editing
  std::string text;
  EXPECT_EQ(ShowResult::OK, compiler_.load("tampered", &text));
  EXPECT_EQ("write_dmx(1, 1)", text);
}

TEST_F(SequenceCompilerTest, ExamplesAreValid){
  const std::vector<ExampleSequence>& examples = SequenceCompiler::exampleSequences();
  ASSERT_EQ(4u, examples.size());
  for(const ExampleSequence& example : examples){
    EXPECT_TRUE(SequenceCompiler::isValidName(example.name)) << example.name;
    ValidationReport report = compiler_.validate(example.source);
    EXPECT_TRUE(report.isValid()) << example.name;
    EXPECT_TRUE(report.warnings.empty()) << example.name;
  }
}
