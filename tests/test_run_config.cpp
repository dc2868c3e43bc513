#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "RunConfig.hpp"
#include "Faults.hpp"

namespace {

// argv builder; keeps the strings alive for the call
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "cmb_daq");
        for (auto &s : storage_) {
            argv_.push_back(s.data());
        }
    }

    int argc() { return static_cast<int>(argv_.size()); }
    char **argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char *> argv_;
};

} // namespace

// ============================================================================
// Calibration mode
// ============================================================================

TEST(ParseCalibrationModeTest, Spellings) {
    EXPECT_EQ(parse_calibration_mode("none").kind, CalibrationMode::Kind::None);
    EXPECT_EQ(parse_calibration_mode("Prompt").kind, CalibrationMode::Kind::None);
    EXPECT_EQ(parse_calibration_mode("auto").kind, CalibrationMode::Kind::Auto);

    CalibrationMode fixed = parse_calibration_mode("fixed:0.25");
    EXPECT_EQ(fixed.kind, CalibrationMode::Kind::Fixed);
    EXPECT_DOUBLE_EQ(fixed.value, 0.25);

    CalibrationMode bare = parse_calibration_mode("-0.5");
    EXPECT_EQ(bare.kind, CalibrationMode::Kind::Fixed);
    EXPECT_DOUBLE_EQ(bare.value, -0.5);
}

TEST(ParseCalibrationModeTest, RejectsGarbage) {
    EXPECT_THROW(parse_calibration_mode("sometimes"), ConfigError);
    EXPECT_THROW(parse_calibration_mode("fixed:"), ConfigError);
    EXPECT_THROW(parse_calibration_mode("fixed:1.0V"), ConfigError);
}

TEST(CalibrationModeTest, Describes) {
    EXPECT_EQ(to_string(CalibrationMode::none()), "prompt");
    EXPECT_EQ(to_string(CalibrationMode::automatic()), "auto");
    EXPECT_EQ(to_string(CalibrationMode::fixed(0.5)), "fixed (0.5)");
}

// ============================================================================
// Validation
// ============================================================================

TEST(ValidateConfigTest, DefaultsAreValid) {
    RunConfiguration config;
    EXPECT_NO_THROW(validate_config(config));
    EXPECT_DOUBLE_EQ(config.duration_s, 30.0);
    EXPECT_EQ(config.calibration.kind, CalibrationMode::Kind::None);
}

TEST(ValidateConfigTest, DurationMustBePositive) {
    RunConfiguration config;
    config.duration_s = 0.0;
    EXPECT_THROW(validate_config(config), ConfigError);
    config.duration_s = -1.0;
    EXPECT_THROW(validate_config(config), ConfigError);
    config.duration_s = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(ValidateConfigTest, AzimuthRange) {
    RunConfiguration config;
    config.azimuth_deg = 359.9;
    EXPECT_NO_THROW(validate_config(config));
    config.azimuth_deg = 360.0;
    EXPECT_THROW(validate_config(config), ConfigError);
    config.azimuth_deg = -0.1;
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(ValidateConfigTest, ElevationRange) {
    RunConfiguration config;
    config.elevation_deg = 90.0;
    EXPECT_NO_THROW(validate_config(config));
    config.elevation_deg = 90.5;
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(ValidateConfigTest, SuffixMustBeText) {
    RunConfiguration config;
    config.output_suffix = "_Readout.csv";
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(ValidateConfigTest, HeaderFieldsSingleLine) {
    RunConfiguration config;
    config.weather = "clear\nsky";
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(ValidateAcquisitionSettingsTest, ChannelAndDecimation) {
    AcquisitionSettings settings;
    EXPECT_NO_THROW(validate_acquisition_settings(settings));
    settings.input_channel = 3;
    EXPECT_THROW(validate_acquisition_settings(settings), ConfigError);
    settings.input_channel = 2;
    settings.decimation = 100;
    EXPECT_THROW(validate_acquisition_settings(settings), ConfigError);
}

// ============================================================================
// Command line
// ============================================================================

TEST(ParseCommandLineTest, FullExperimentHeader) {
    Args args{"--temperature", "4.2", "--weather", "very clear", "--azimuth", "37.5",
              "--elevation", "48.70", "--duration", "60", "--calibration", "fixed:0.01",
              "--calibrator", "--calibrator-temperature", "Hot", "--prefix", "/tmp/run/BW",
              "--suffix", "_LCal2_BNC.txt", "--channel", "2", "--hv", "--decimation", "8192",
              "--trigger-timeout", "500", "-y"};

    CommandLine cli = parse_command_line(args.argc(), args.argv());

    EXPECT_DOUBLE_EQ(cli.config.temperature_c, 4.2);
    EXPECT_EQ(cli.config.weather, "very clear");
    EXPECT_DOUBLE_EQ(cli.config.azimuth_deg, 37.5);
    EXPECT_DOUBLE_EQ(cli.config.elevation_deg, 48.7);
    EXPECT_DOUBLE_EQ(cli.config.duration_s, 60.0);
    EXPECT_EQ(cli.config.calibration.kind, CalibrationMode::Kind::Fixed);
    EXPECT_DOUBLE_EQ(cli.config.calibration.value, 0.01);
    EXPECT_TRUE(cli.config.calibrator_in_view);
    EXPECT_EQ(cli.config.calibrator_temperature, "Hot");
    EXPECT_EQ(cli.config.output_prefix, "/tmp/run/BW");
    EXPECT_EQ(cli.config.output_suffix, "_LCal2_BNC.txt");
    EXPECT_EQ(cli.acquisition.input_channel, 2);
    EXPECT_TRUE(cli.acquisition.high_voltage_range);
    EXPECT_EQ(cli.acquisition.decimation, 8192u);
    EXPECT_EQ(cli.acquisition.trigger_timeout_ms, 500);
    EXPECT_TRUE(cli.assume_yes);
}

TEST(ParseCommandLineTest, DefaultsWhenNoArguments) {
    Args args{};
    CommandLine cli = parse_command_line(args.argc(), args.argv());

    EXPECT_DOUBLE_EQ(cli.config.duration_s, DEFAULT_DURATION_S);
    EXPECT_EQ(cli.config.calibration.kind, CalibrationMode::Kind::None);
    EXPECT_EQ(cli.config.output_prefix, DEFAULT_OUTPUT_PREFIX);
    EXPECT_FALSE(cli.assume_yes);
}

TEST(ParseCommandLineTest, Help) {
    Args args{"--help"};
    EXPECT_TRUE(parse_command_line(args.argc(), args.argv()).show_help);
}

TEST(ParseCommandLineTest, Errors) {
    Args unknown{"--colour", "red"};
    EXPECT_THROW(parse_command_line(unknown.argc(), unknown.argv()), ConfigError);

    Args missing{"--azimuth"};
    EXPECT_THROW(parse_command_line(missing.argc(), missing.argv()), ConfigError);

    Args not_number{"--duration", "thirty"};
    EXPECT_THROW(parse_command_line(not_number.argc(), not_number.argv()), ConfigError);

    Args zero{"--duration", "0"};
    EXPECT_THROW(parse_command_line(zero.argc(), zero.argv()), ConfigError);

    Args out_of_range{"--azimuth", "400"};
    EXPECT_THROW(parse_command_line(out_of_range.argc(), out_of_range.argv()), ConfigError);
}

// ============================================================================
// Header description
// ============================================================================

TEST(DescribeConfigurationTest, MatchesRecordHeaderLayout) {
    RunConfiguration config;
    config.temperature_c = 25.4;
    config.weather = "very clear";
    config.elevation_deg = 48.7;
    config.azimuth_deg = 0.0;

    std::vector<std::string> lines = describe_configuration(config);

    ASSERT_EQ(lines.size(), 9u);
    EXPECT_EQ(lines[0], "Duration (in s): 30");
    EXPECT_EQ(lines[1], "Pointing Position of the Horn: Sky");
    EXPECT_EQ(lines[2], "Angle pointing (from horizontal perpendicular to supporting axis): 48.7");
    EXPECT_EQ(lines[3], "Angle pointing (from horizontal parallel to supporting axis): 0");
    EXPECT_EQ(lines[4], "Calibrator used: NO");
    EXPECT_EQ(lines[5], "Temperature Outside (in celsius): 25.4");
    EXPECT_EQ(lines[6], "Temperature of the calibrator (in celsius): Low");
    EXPECT_EQ(lines[7], "Weather: very clear");
    EXPECT_EQ(lines[8], "Units: Volts");
}

TEST(DescribeConfigurationTest, CalibratorInView) {
    RunConfiguration config;
    config.calibrator_in_view = true;

    std::vector<std::string> lines = describe_configuration(config);

    EXPECT_EQ(lines[1], "Pointing Position of the Horn: Calibrator paddle");
    EXPECT_EQ(lines[4], "Calibrator used: YES");
}

TEST(DescribeConfigurationTest, ExplicitPointingOverridesDerivedText) {
    RunConfiguration config;
    config.calibrator_in_view = true;
    config.pointing = "Zenith, paddle lowered";

    std::vector<std::string> lines = describe_configuration(config);

    EXPECT_EQ(lines[1], "Pointing Position of the Horn: Zenith, paddle lowered");
    EXPECT_EQ(lines[4], "Calibrator used: YES");
}

TEST(ParseCommandLineTest, PointingOption) {
    Args args{"--pointing", "North wall"};
    CommandLine cli = parse_command_line(args.argc(), args.argv());

    EXPECT_EQ(cli.config.pointing, "North wall");
    EXPECT_EQ(pointing_description(cli.config), "North wall");
}

TEST(ValidateConfigTest, PointingSingleLine) {
    RunConfiguration config;
    config.pointing = "Sky\nextra";
    EXPECT_THROW(validate_config(config), ConfigError);
}

// ============================================================================
// Numeric option values
// ============================================================================

TEST(ParseDoubleOptionTest, WholeStringOnly) {
    EXPECT_DOUBLE_EQ(parse_double_option("--hot", "1.5"), 1.5);
    EXPECT_DOUBLE_EQ(parse_double_option("--hot", "-2.5e-3"), -2.5e-3);
    EXPECT_THROW(parse_double_option("--hot", "1.5V"), ConfigError);
    EXPECT_THROW(parse_double_option("--hot", ""), ConfigError);
    EXPECT_THROW(parse_double_option("--hot", "1e999"), ConfigError);
}

TEST(ParseDoubleOptionTest, MessageNamesTheOption) {
    try {
        parse_double_option("--t-cold", "cold");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("--t-cold"), std::string::npos);
    }
}
