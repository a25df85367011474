#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "stiffrk/integrator_options.h"
#include "stiffrk/optionable.h"

using namespace stiffrk;

TEST (Optionable, UnsetNamesAreNotDefined)
{
  Optionable options;
  int int_value = 3;
  double double_value = 3.0;
  std::string string_value = "unchanged";
  EXPECT_EQ(options.GetIntOption("missing", &int_value),
            OPTIONABLE_STATUS_OPTION_NOT_DEFINED);
  EXPECT_EQ(options.GetDoubleOption("missing", &double_value),
            OPTIONABLE_STATUS_OPTION_NOT_DEFINED);
  EXPECT_EQ(options.GetStringOption("missing", &string_value),
            OPTIONABLE_STATUS_OPTION_NOT_DEFINED);
  EXPECT_EQ(int_value, 3);
  EXPECT_EQ(double_value, 3.0);
  EXPECT_EQ(string_value, "unchanged");
}

TEST (Optionable, SetAndMerge)
{
  Optionable options;
  EXPECT_EQ(options.SetIntOption("a", 1), OPTIONABLE_STATUS_SUCCESS);
  EXPECT_EQ(options.SetDoubleOption("b", 2.5), OPTIONABLE_STATUS_SUCCESS);
  EXPECT_EQ(options.SetStringOption("c", "x"), OPTIONABLE_STATUS_SUCCESS);

  Optionable::IntOptions more;
  more["a"] = 10;
  more["d"] = 4;
  options.SetIntOptions(more);

  int value;
  ASSERT_EQ(options.GetIntOption("a", &value), OPTIONABLE_STATUS_SUCCESS);
  EXPECT_EQ(value, 10);
  ASSERT_EQ(options.GetIntOption("d", &value), OPTIONABLE_STATUS_SUCCESS);
  EXPECT_EQ(value, 4);

  Optionable::IntOptions all;
  options.GetIntOptions(&all);
  EXPECT_EQ(all.size(), 2u);

  double b;
  ASSERT_EQ(options.GetDoubleOption("b", &b), OPTIONABLE_STATUS_SUCCESS);
  EXPECT_EQ(b, 2.5);
  std::string c;
  ASSERT_EQ(options.GetStringOption("c", &c), OPTIONABLE_STATUS_SUCCESS);
  EXPECT_EQ(c, "x");
}

TEST (IntegratorOptions, DefaultsMatchConfigDefaults)
{
  IntegratorOptions options;
  IntegratorConfig config;
  IntegratorConfig defaults;
  config.max_steps = -1;
  ASSERT_EQ(options.GetConfig(&config), SUCCESS);

  EXPECT_EQ(config.rel_tol, defaults.rel_tol);
  EXPECT_EQ(config.abs_tol, defaults.abs_tol);
  EXPECT_EQ(config.h_init, 1.0e-6);
  EXPECT_EQ(config.max_steps, 100000);
  EXPECT_EQ(config.max_newton_iterations, 7);
  EXPECT_EQ(config.max_consecutive_rejections, 50);
  EXPECT_EQ(config.max_singular_retries, 1);
  EXPECT_EQ(config.max_jacobian_age, 0);
  EXPECT_EQ(config.jacobian_reuse_threshold, 1.0e-3);
  EXPECT_EQ(config.step_keep_lower, 1.0);
  EXPECT_EQ(config.step_keep_upper, 1.2);
  EXPECT_EQ(config.safety, 0.9);
  EXPECT_EQ(config.fac_min, 0.2);
  EXPECT_EQ(config.fac_max, 8.0);
  EXPECT_EQ(config.reject_factor, 0.5);
  EXPECT_EQ(config.error_exponent, 0.2);
  EXPECT_TRUE(config.predictive_controller);
  EXPECT_TRUE(config.correct_error_estimate);
  EXPECT_EQ(config.stiffness_window, 15);
  EXPECT_EQ(config.verbosity, 0);
  EXPECT_EQ(config.linear_solver, "dense");
}

TEST (IntegratorOptions, ChangedValuesReachConfig)
{
  IntegratorOptions options;
  options.SetDoubleOption("rel_tol", 1.0e-8);
  options.SetDoubleOption("h_max", 0.5);
  options.SetIntOption("predictive_controller", 0);
  options.SetStringOption("linear_solver", "sparse");

  IntegratorConfig config;
  ASSERT_EQ(options.GetConfig(&config), SUCCESS);
  ASSERT_EQ(config.rel_tol.size(), 1u);
  EXPECT_EQ(config.rel_tol[0], 1.0e-8);
  EXPECT_EQ(config.h_max, 0.5);
  EXPECT_FALSE(config.predictive_controller);
  EXPECT_EQ(config.linear_solver, "sparse");
}

TEST (IntegratorOptions, ToleranceVectorsReplaceScalars)
{
  IntegratorOptions options;
  std::vector<double> rtol(3, 1.0e-5);
  std::vector<double> atol(3, 1.0e-9);
  atol[2] = 1.0e-12;
  options.SetToleranceVectors(rtol, atol);

  IntegratorConfig config;
  ASSERT_EQ(options.GetConfig(&config), SUCCESS);
  EXPECT_EQ(config.rel_tol, rtol);
  EXPECT_EQ(config.abs_tol, atol);

  atol[1] = 0.0;
  options.SetToleranceVectors(rtol, atol);
  EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT);
}

class InvalidDoubleOption
  : public ::testing::TestWithParam<std::pair<const char *, double> >
{};

TEST_P (InvalidDoubleOption, Rejected)
{
  IntegratorOptions options;
  options.SetDoubleOption(GetParam().first, GetParam().second);
  IntegratorConfig config;
  EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT) << GetParam().first;
}

INSTANTIATE_TEST_SUITE_P(
    OutOfRange,
    InvalidDoubleOption,
    ::testing::Values(std::make_pair("rel_tol", 0.0),
                      std::make_pair("abs_tol", -1.0e-10),
                      std::make_pair("h_min", -1.0),
                      std::make_pair("h_max", -1.0),
                      std::make_pair("step_keep_lower", 1.5),
                      std::make_pair("step_keep_upper", 0.9),
                      std::make_pair("safety", 1.0),
                      std::make_pair("fac_min", 0.0),
                      std::make_pair("fac_max", 0.5),
                      std::make_pair("reject_factor", 1.0),
                      std::make_pair("error_exponent", 0.0),
                      std::make_pair("dense_output_step", -0.1),
                      std::make_pair("max_wall_time", -1.0)));

TEST (IntegratorOptions, InvalidIntegerOptions)
{
  IntegratorConfig config;
  {
    IntegratorOptions options;
    options.SetIntOption("max_steps", 0);
    EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT);
  }
  {
    IntegratorOptions options;
    options.SetIntOption("max_newton_iterations", 0);
    EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT);
  }
  {
    IntegratorOptions options;
    options.SetIntOption("max_singular_retries", -1);
    EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT);
  }
  {
    IntegratorOptions options;
    options.SetIntOption("stiffness_window", 0);
    EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT);
  }
}

TEST (IntegratorOptions, MinAboveMaxStep)
{
  IntegratorOptions options;
  options.SetDoubleOption("h_min", 0.2);
  options.SetDoubleOption("h_max", 0.1);
  IntegratorConfig config;
  EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT);
}

TEST (IntegratorOptions, WrongTypeAndUnknownSolver)
{
  IntegratorConfig config;
  {
    IntegratorOptions options;
    options.SetDoubleOption("max_steps", 10.0);
    EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT);
  }
  {
    IntegratorOptions options;
    options.SetStringOption("linear_solver", "magic");
    EXPECT_EQ(options.GetConfig(&config), INVALID_INPUT);
  }
}


int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
