#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "classification_interpreter.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace CropDoctor;
using CropDoctor::test_support::peakedScores;
using CropDoctor::test_support::shippedLabels;

TEST(ClassificationInterpreterTest, PicksHighestProbability) {
    ClassificationInterpreter interpreter(shippedLabels());
    ClassificationResult result = interpreter.interpret(peakedScores(30, 0.945f));
    ASSERT_NE(result.label, nullptr);
    EXPECT_EQ(result.label->key, "Tomato___Early_blight");
    EXPECT_NEAR(result.confidencePercent, 94.5, 1e-3);
}

TEST(ClassificationInterpreterTest, TiesGoToLowerIndex) {
    std::vector<float> scores(CLASS_COUNT, 0.0f);
    scores[12] = 0.5f;
    scores[7] = 0.5f;
    ClassificationResult result = ClassificationInterpreter(shippedLabels()).interpret(scores);
    EXPECT_EQ(result.label->index, 7u);
}

TEST(ClassificationInterpreterTest, ConfidenceIsClamped) {
    std::vector<float> scores(CLASS_COUNT, 0.0f);
    scores[3] = 1.2f;
    EXPECT_DOUBLE_EQ(ClassificationInterpreter(shippedLabels()).interpret(scores).confidencePercent, 100.0);

    std::vector<float> negative(CLASS_COUNT, -2.0f);
    negative[5] = -1.0f;
    EXPECT_DOUBLE_EQ(ClassificationInterpreter(shippedLabels()).interpret(negative).confidencePercent, 0.0);
}

TEST(ClassificationInterpreterTest, SkipsNonFiniteScores) {
    std::vector<float> scores(CLASS_COUNT, 0.01f);
    scores[0] = std::numeric_limits<float>::quiet_NaN();
    scores[20] = 0.6f;
    EXPECT_EQ(ClassificationInterpreter(shippedLabels()).interpret(scores).label->index, 20u);
}

TEST(ClassificationInterpreterTest, RejectsMalformedOutput) {
    ClassificationInterpreter interpreter(shippedLabels());
    EXPECT_THROW(interpreter.interpret(std::vector<float>(38, 0.1f)), ClassifierError);
    EXPECT_THROW(interpreter.interpret({}), ClassifierError);
    EXPECT_THROW(interpreter.interpret(std::vector<float>(CLASS_COUNT, std::nanf(""))), ClassifierError);
}

TEST(ClassificationInterpreterTest, HealthyRegardlessOfConfidence) {
    ClassificationResult result = ClassificationInterpreter(shippedLabels()).interpret(peakedScores(38, 0.3f));
    EXPECT_TRUE(result.label->isHealthy);
    EXPECT_FALSE(result.label->isBackground);
}
