#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

#include "converge/command_stepper.hh"
#include "converge/error.hh"
#include "test_support.hh"

using converge::CommandStepper;
using converge_test::TempDir;
using converge_test::steps;

namespace fs = std::filesystem;

namespace {

  // Answers by grepping the request file, and keeps copies of the last
  // begin/update-options requests next to itself
  std::string helper_script( const std::string& dir ) {
    return
      "#!/bin/sh\n"
      "req=\"$2\"\n"
      "case \"$1\" in\n"
      "  begin)\n"
      "    cp \"$req\" '" + dir + "/last-begin.yaml'\n"
      "    if grep -q broken \"$req\"; then\n"
      "      printf 'error: validation\\nmessage: bad host\\nfield: host\\n"
      "step: 1\\n'\n"
      "    elif grep -q vague \"$req\"; then\n"
      "      printf 'error: validation\\nmessage: bad host\\nfield: host\\n"
      "step: -1\\n'\n"
      "    elif grep -q sleepy \"$req\"; then\n"
      "      sleep 5; printf 'handle: late\\n'\n"
      "    elif grep -q taken \"$req\"; then\n"
      "      printf 'error: conflict\\nmessage: already configured\\n'\n"
      "    elif grep -q crashy \"$req\"; then\n"
      "      echo boom >&2; exit 3\n"
      "    elif grep -q silent \"$req\"; then\n"
      "      printf 'ok: true\\n'\n"
      "    else\n"
      "      printf 'handle: inst-42\\n'\n"
      "    fi ;;\n"
      "  remove)\n"
      "    if grep -q inst-gone \"$req\"; then\n"
      "      printf 'error: not_found\\nmessage: no such entry\\n'\n"
      "    else\n"
      "      printf 'ok: true\\n'\n"
      "    fi ;;\n"
      "  update-options)\n"
      "    cp \"$req\" '" + dir + "/last-options.yaml'\n"
      "    printf 'ok: true\\n' ;;\n"
      "  supports-options)\n"
      "    if grep -q inst-plain \"$req\"; then\n"
      "      printf 'supported: false\\n'\n"
      "    else\n"
      "      printf 'supported: true\\n'\n"
      "    fi ;;\n"
      "  exists)\n"
      "    if grep -q inst-gone \"$req\"; then\n"
      "      printf 'exists: false\\n'\n"
      "    elif grep -q inst-old \"$req\"; then\n"
      "      printf '{}\\n'\n"
      "    else\n"
      "      printf 'exists: true\\n'\n"
      "    fi ;;\n"
      "  *) exit 64 ;;\n"
      "esac\n";
  }

  class CommandStepperTest : public ::testing::Test {
  protected:
    TempDir dir;
    std::string helper;
    std::string scratch;

    void SetUp() override {
      helper = dir.file( "helper.sh" );
      converge_test::write_file( helper, helper_script(dir.path().string()) );
      fs::permissions( helper, fs::perms::owner_all );
      scratch = dir.file( "scratch" );
      fs::create_directory( scratch );
    }

    CommandStepper stepper() const {
      return CommandStepper( helper, converge::DEFAULT_HELPER_TIMEOUT,
        scratch );
    }
  };

} // anonymous namespace

TEST_F( CommandStepperTest, BeginReturnsHandleAndSendsAnswers ) {
  CommandStepper s = stepper();
  const converge::InstanceHandle h = s.begin( "broadlink",
    steps("- host: 192.168.3.146\n- name: Office Broadlink\n") );
  EXPECT_EQ( h, "inst-42" );

  const converge::ordered_node request = converge::ordered_node::deserialize(
    converge_test::read_file(dir.file("last-begin.yaml")) );
  EXPECT_EQ( request.at(std::string("platform")).get_value< std::string >(),
    "broadlink" );
  ASSERT_TRUE( request.at(std::string("answers")).is_sequence() );
  EXPECT_EQ( request.at(std::string("answers")).size(), 2u );
}

TEST_F( CommandStepperTest, RequestFilesAreRemoved ) {
  CommandStepper s = stepper();
  s.begin( "broadlink", steps("- host: a\n") );
  s.remove( "inst-42" );
  EXPECT_TRUE( fs::is_empty(scratch) );
}

TEST_F( CommandStepperTest, ValidationErrorCarriesFieldAndStep ) {
  CommandStepper s = stepper();
  try {
    s.begin( "broken", steps("- host: a\n") );
    FAIL() << "expected ValidationError";
  } catch ( const converge::ValidationError& ex ) {
    EXPECT_EQ( ex.field(), "host" );
    ASSERT_TRUE( ex.step().has_value() );
    EXPECT_EQ( *ex.step(), 1u );
    EXPECT_STREQ( ex.what(), "step 1, field 'host': bad host" );
  }
}

TEST_F( CommandStepperTest, ConflictIsMapped ) {
  CommandStepper s = stepper();
  EXPECT_THROW( s.begin("taken", steps("- host: a\n")),
    converge::ConflictError );
}

TEST_F( CommandStepperTest, FailedHelperIsTransient ) {
  CommandStepper s = stepper();
  EXPECT_THROW( s.begin("crashy", steps("- host: a\n")),
    converge::TransientError );
}

TEST_F( CommandStepperTest, MissingHandleIsAnError ) {
  CommandStepper s = stepper();
  EXPECT_THROW( s.begin("silent", steps("- host: a\n")), converge::Error );
}

TEST_F( CommandStepperTest, MissingHelperIsTransient ) {
  CommandStepper s( dir.file("no-such-helper"),
    converge::DEFAULT_HELPER_TIMEOUT, scratch );
  EXPECT_THROW( s.remove("inst-42"), converge::TransientError );
}

TEST_F( CommandStepperTest, RemoveOfGoneInstanceIsNotFound ) {
  CommandStepper s = stepper();
  EXPECT_NO_THROW( s.remove("inst-42") );
  EXPECT_THROW( s.remove("inst-gone"), converge::NotFoundError );
}

TEST_F( CommandStepperTest, OptionsSupportAndUpdate ) {
  CommandStepper s = stepper();
  EXPECT_TRUE( s.supports_options("inst-42") );
  EXPECT_FALSE( s.supports_options("inst-plain") );

  s.update_options( "inst-42", steps("- learning_timeout: 30\n") );
  const converge::ordered_node request = converge::ordered_node::deserialize(
    converge_test::read_file(dir.file("last-options.yaml")) );
  EXPECT_EQ( request.at(std::string("handle")).get_value< std::string >(),
    "inst-42" );
  EXPECT_EQ( request.at(std::string("options")).size(), 1u );
}

TEST_F( CommandStepperTest, ExistsReportsLiveInstances ) {
  CommandStepper s = stepper();
  EXPECT_TRUE( s.instance_exists("inst-42") );
  EXPECT_FALSE( s.instance_exists("inst-gone") );
  EXPECT_TRUE( s.instance_exists("inst-old") );
}

TEST_F( CommandStepperTest, NegativeStepNamesNoStep ) {
  CommandStepper s = stepper();
  try {
    s.begin( "vague", steps("- host: a\n") );
    FAIL() << "expected ValidationError";
  } catch ( const converge::ValidationError& ex ) {
    EXPECT_EQ( ex.field(), "host" );
    EXPECT_FALSE( ex.step().has_value() );
    EXPECT_STREQ( ex.what(), "field 'host': bad host" );
  }
}

TEST_F( CommandStepperTest, HungHelperTimesOut ) {
  CommandStepper s( helper, std::chrono::milliseconds(200), scratch );
  const auto started = std::chrono::steady_clock::now();
  EXPECT_THROW( s.begin("sleepy", steps("- host: a\n")),
    converge::TransientError );
  EXPECT_LT( std::chrono::steady_clock::now() - started,
    std::chrono::seconds(3) );
  EXPECT_TRUE( fs::is_empty(scratch) );
}

TEST_F( CommandStepperTest, HelperPathIsNotShellParsed ) {
  const std::string odd = dir.file( "it's a helper.sh" );
  fs::copy_file( helper, odd );
  fs::permissions( odd, fs::perms::owner_all );
  CommandStepper s( odd, converge::DEFAULT_HELPER_TIMEOUT, scratch );
  EXPECT_EQ( s.begin("broadlink", steps("- host: a\n")), "inst-42" );
}
