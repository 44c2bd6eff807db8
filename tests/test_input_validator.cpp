/**
 * @file test_input_validator.cpp
 * @brief Intensity payload validation tests
 */

#include "core/InputValidator.hpp"
#include "core/RenderError.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace prefmap;
using json = nlohmann::json;

class InputValidatorTest : public ::testing::Test {
protected:
    std::string rejection_for(const std::string& payload) const {
        try {
            validator_.parse_intensities(payload);
        } catch (const InputValidationError& e) {
            EXPECT_TRUE(e.is_client_error());
            return e.detail();
        }
        ADD_FAILURE() << "payload accepted: " << payload;
        return "";
    }

    InputValidator validator_;
};

TEST_F(InputValidatorTest, AcceptsWellFormedPayload) {
    IntensityAssignment result = validator_.parse_intensities(R"([{"id":13,"scale":5},{"id":27,"scale":1}])");

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result.at(13), 5);
    EXPECT_EQ(result.at(27), 1);
}

TEST_F(InputValidatorTest, EmptyArrayIsValid) {
    EXPECT_TRUE(validator_.parse_intensities("[]").empty());
}

TEST_F(InputValidatorTest, BoundaryLevelsAccepted) {
    IntensityAssignment result = validator_.parse_intensities(R"([{"id":1,"scale":0},{"id":2,"scale":7}])");
    EXPECT_EQ(result.at(1), 0);
    EXPECT_EQ(result.at(2), 7);
}

TEST_F(InputValidatorTest, MissingPayload) {
    EXPECT_EQ(rejection_for(""), "scale parameter is required");
}

TEST_F(InputValidatorTest, SyntaxError) {
    std::string message = rejection_for("[{\"id\":13,");
    EXPECT_EQ(message.rfind("Invalid scale data format", 0), 0u) << message;
}

TEST_F(InputValidatorTest, NonArrayPayload) {
    EXPECT_EQ(rejection_for(R"({"id":13,"scale":5})"),
              "Invalid scale data format: expected a JSON array");
}

TEST_F(InputValidatorTest, ScaleOutOfRange) {
    EXPECT_EQ(rejection_for(R"([{"id":13,"scale":9}])"), "Invalid scale value for ID 13: 9");
    EXPECT_EQ(rejection_for(R"([{"id":4,"scale":-1}])"), "Invalid scale value for ID 4: -1");
    EXPECT_EQ(rejection_for(R"([{"id":13,"scale":4294967301}])"), "Invalid scale value for ID 13: 4294967301");
    EXPECT_EQ(rejection_for(R"([{"id":13,"scale":-4294967291}])"), "Invalid scale value for ID 13: -4294967291");
    EXPECT_EQ(rejection_for(R"([{"id":13,"scale":18446744073709551615}])"),
              "Invalid scale data format: entry 0 has a non-integer scale");
}

TEST_F(InputValidatorTest, IdsOutsideIntRangeRejected) {
    EXPECT_EQ(rejection_for(R"([{"id":4294967309,"scale":5}])"),
              "Invalid scale data format: entry 0 has an id out of range: 4294967309");
    EXPECT_EQ(rejection_for(R"([{"id":-4294967283,"scale":5}])"),
              "Invalid scale data format: entry 0 has an id out of range: -4294967283");
}

TEST_F(InputValidatorTest, EveryIssueIsReported) {
    ValidationResult result = validator_.validate(json::parse(
        R"([{"id":1,"scale":8},{"id":2,"scale":3},{"id":3,"scale":12}])"));

    EXPECT_TRUE(result.has_errors());
    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_EQ(result.issues[0].region_id, 1);
    EXPECT_EQ(result.issues[1].region_id, 3);
    EXPECT_EQ(result.format_error_message(),
              "Invalid scale value for ID 1: 8; Invalid scale value for ID 3: 12");
    EXPECT_TRUE(result.intensities.empty());
}

TEST_F(InputValidatorTest, MissingFieldsDefaultToZero) {
    IntensityAssignment result = validator_.parse_intensities(R"([{"scale":4},{"id":9}])");

    EXPECT_EQ(result.at(0), 4);
    EXPECT_EQ(result.at(9), 0);
}

TEST_F(InputValidatorTest, NullFieldsDefaultToZero) {
    IntensityAssignment result = validator_.parse_intensities(R"([{"id":13,"scale":null},{"id":null,"scale":3}])");

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result.at(13), 0);
    EXPECT_EQ(result.at(0), 3);
}

TEST_F(InputValidatorTest, LaterDuplicateWins) {
    IntensityAssignment result = validator_.parse_intensities(R"([{"id":13,"scale":2},{"id":13,"scale":6}])");

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result.at(13), 6);
}

TEST_F(InputValidatorTest, NonIntegerFieldsRejected) {
    EXPECT_EQ(rejection_for(R"([{"id":"13","scale":5}])"),
              "Invalid scale data format: entry 0 has a non-integer id");
    EXPECT_EQ(rejection_for(R"([{"id":13,"scale":2.5}])"),
              "Invalid scale data format: entry 0 has a non-integer scale");
    EXPECT_EQ(rejection_for(R"([{"id":13,"scale":5}, 7])"),
              "Invalid scale data format: entry 1 is not an object");
}

TEST_F(InputValidatorTest, ValidResultHasNoMessage) {
    ValidationResult result = validator_.validate(json::parse(R"([{"id":13,"scale":5}])"));
    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(result.format_error_message(), "");
}
