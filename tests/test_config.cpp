#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config.hpp"
#include "errors.hpp"
#include "transmitter.hpp"

namespace fs = std::filesystem;

TEST(Config, TransmitDefaults) {
    CommandLine cl = parse_command_line({"tx", "payload.bin"});
    ASSERT_EQ(cl.mode, Mode::Transmit);
    EXPECT_FALSE(cl.silent);
    EXPECT_EQ(cl.tx.payload_path, "payload.bin");
    EXPECT_TRUE(cl.tx.outfile.empty());
    EXPECT_EQ(cl.tx.segment_bytes, 1024u);
    EXPECT_FALSE(cl.tx.zlib);
    EXPECT_EQ(cl.tx.frame.image_size, 450);
    EXPECT_DOUBLE_EQ(cl.tx.delay, 1.0);
    EXPECT_EQ(cl.tx.frame.qr_version, 25);
    EXPECT_EQ(cl.tx.frame.level, ErrorCorrection::L);
    EXPECT_FALSE(cl.tx.display);
    EXPECT_TRUE(cl.tx.shows_frames());
}

TEST(Config, TransmitOptions) {
    CommandLine cl = parse_command_line({"--silent", "tx", "in.bin", "out.gif", "--bytes", "512",
                                         "--zlib", "--size=600", "--delay", "0.5", "--ver", "30",
                                         "--ec", "q"});
    ASSERT_EQ(cl.mode, Mode::Transmit);
    EXPECT_TRUE(cl.silent);
    EXPECT_EQ(cl.tx.outfile, "out.gif");
    EXPECT_EQ(cl.tx.segment_bytes, 512u);
    EXPECT_TRUE(cl.tx.zlib);
    EXPECT_EQ(cl.tx.frame.image_size, 600);
    EXPECT_DOUBLE_EQ(cl.tx.delay, 0.5);
    EXPECT_EQ(cl.tx.frame.qr_version, 30);
    EXPECT_EQ(cl.tx.frame.level, ErrorCorrection::Q);
    EXPECT_FALSE(cl.tx.shows_frames());
}

TEST(Config, DisplayWithOutfileShowsFrames) {
    CommandLine cl = parse_command_line({"tx", "in.bin", "out.gif", "--display"});
    EXPECT_TRUE(cl.tx.shows_frames());
}

TEST(Config, ReceiveArguments) {
    CommandLine cl = parse_command_line({"rx", "0", "out.bin", "--timeout", "30", "--workers", "2"});
    ASSERT_EQ(cl.mode, Mode::Receive);
    EXPECT_EQ(cl.rx.source, "0");
    EXPECT_EQ(cl.rx.outfile, "out.bin");
    EXPECT_DOUBLE_EQ(cl.rx.timeout, 30.0);
    EXPECT_EQ(cl.rx.workers, 2u);
}

TEST(Config, HelpWins) {
    EXPECT_EQ(parse_command_line({"tx", "--help"}).mode, Mode::Help);
}

TEST(Config, BadArgumentsAreInvalidConfiguration) {
    EXPECT_THROW(parse_command_line({}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"tx"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"rx"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"send", "x"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"tx", "a", "--bytes", "0"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"tx", "a", "--bytes", "12k"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"tx", "a", "--bytes"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"tx", "a", "--ver", "41"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"tx", "a", "--ec", "X"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"tx", "a", "--frobnicate"}), InvalidConfiguration);
    EXPECT_THROW(parse_command_line({"tx", "a", "b", "c"}), InvalidConfiguration);
}

TEST(Config, ErrorCorrectionLevels) {
    EXPECT_EQ(parse_error_correction("L"), ErrorCorrection::L);
    EXPECT_EQ(parse_error_correction("m"), ErrorCorrection::M);
    EXPECT_EQ(parse_error_correction("H"), ErrorCorrection::H);
    EXPECT_EQ(to_char(ErrorCorrection::Q), 'Q');
    EXPECT_THROW(parse_error_correction(""), InvalidConfiguration);
    EXPECT_THROW(parse_error_correction("LM"), InvalidConfiguration);
}

class ConfigFiles : public ::testing::Test {
protected:
    void SetUp() override {
        payload = (fs::path(dir.path()) / "payload.bin").string();
        std::ofstream(payload) << "hello";
        config.payload_path = payload;
    }

    TempFrameDir dir;
    std::string payload;
    TransmitConfig config;
};

TEST_F(ConfigFiles, ValidConfigurationPasses) {
    config.outfile = (fs::path(dir.path()) / "out.gif").string();
    EXPECT_NO_THROW(validate_transmit_config(config));
}

TEST_F(ConfigFiles, MissingPayloadIsRejected) {
    config.payload_path = (fs::path(dir.path()) / "absent.bin").string();
    EXPECT_THROW(validate_transmit_config(config), InvalidConfiguration);
}

TEST_F(ConfigFiles, OutfileInMissingDirectoryIsRejected) {
    config.outfile = (fs::path(dir.path()) / "no-such-dir" / "out.gif").string();
    EXPECT_THROW(validate_transmit_config(config), InvalidConfiguration);
}

TEST_F(ConfigFiles, ImageBelowVersionMinimumIsRejected) {
    config.frame.qr_version = 25;
    config.frame.image_size = 124;
    EXPECT_THROW(validate_transmit_config(config), InvalidConfiguration);
    config.frame.image_size = 125;
    EXPECT_NO_THROW(validate_transmit_config(config));
}

TEST_F(ConfigFiles, NonPositiveDelayIsRejected) {
    config.delay = 0.0;
    EXPECT_THROW(validate_transmit_config(config), InvalidConfiguration);
}

TEST(Config, ReceiveValidation) {
    ReceiveConfig rx;
    EXPECT_THROW(validate_receive_config(rx), InvalidConfiguration);
    rx.source = "frames";
    EXPECT_NO_THROW(validate_receive_config(rx));
    rx.timeout = -1.0;
    EXPECT_THROW(validate_receive_config(rx), InvalidConfiguration);
}

TEST(Config, WorkerCountDefaultsToHardware) {
    EXPECT_EQ(resolve_workers(3), 3u);
    EXPECT_GE(resolve_workers(0), 1u);
}
