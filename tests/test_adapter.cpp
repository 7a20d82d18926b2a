#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <lapseg/csv.hpp>
#include <lapseg/sample.hpp>

using Catch::Approx;
using namespace lapseg;

TEST_CASE("adapt_sample: shared memory field names") {
  FieldMap f{
    {"lap", "5"}, {"lap_distance", "1234.5"}, {"lap_time", "42.1"},
    {"last_lap_time", "98.7"}, {"speed", "210"}, {"rpm", "11000"},
    {"throttle", "0.8"}, {"brake", "0"}, {"steering", "-0.1"}, {"gear", "5"},
    {"position_x", "10"}, {"position_z", "-20"}, {"sector", "2"},
    {"sector1_time", "30.2"}, {"sector2_time", "0"},
    {"sector_boundaries", "1800;3600;5400"}, {"track_length", "5400"},
    {"driver_name", " Rival "}, {"control", "2"}, {"position", "3"},
    {"car_class", "GT3"}, {"team_name", ""},
  };
  const TelemetrySample s = adapt_sample(f, SourceSchema::SharedMemory);
  REQUIRE(s.lap == 5);
  REQUIRE(s.lap_distance_m.value() == Approx(1234.5));
  REQUIRE(s.lap_time_s.value() == Approx(42.1));
  REQUIRE(s.last_lap_time_s.value() == Approx(98.7));
  REQUIRE(s.speed_kmh.value() == Approx(210.0));
  REQUIRE(s.steer.value() == Approx(-0.1));
  REQUIRE(s.sector == 2);
  REQUIRE(s.sector_splits_s.size() == 2);
  REQUIRE(s.sector_splits_s[0] == Approx(30.2));
  REQUIRE(s.sector_boundaries_m == std::vector<double>{1800.0, 3600.0, 5400.0});
  REQUIRE(s.track_length_m.value() == Approx(5400.0));
  REQUIRE(s.driver_name == "Rival");
  REQUIRE(s.control == ControlType::Remote);
  REQUIRE(s.position == 3);
  REQUIRE(s.vehicle.car_class == std::string("GT3"));
  REQUIRE_FALSE(s.vehicle.team_name.has_value());
  REQUIRE_FALSE(s.vehicle.car_model.has_value());
}

TEST_CASE("adapt_sample: export column names") {
  FieldMap f{
    {"Lap [int]", "2"}, {"LapDistance [m]", "88.0"}, {"LapTime [s]", "3.5"},
    {"Speed [km/h]", "145.2"}, {"ThrottlePercentage [%]", "64"},
    {"Steer [%]", "-12"}, {"Gear [int]", "3"}, {"Sector1Time [s]", "0"},
    {"Control [int]", "0"},
  };
  const TelemetrySample s = adapt_sample(f, SourceSchema::ExportColumns);
  REQUIRE(s.lap == 2);
  REQUIRE(s.lap_distance_m.value() == Approx(88.0));
  REQUIRE(s.throttle.value() == Approx(64.0));
  REQUIRE(s.steer.value() == Approx(-12.0));
  REQUIRE(s.sector_splits_s.size() == 1);
  REQUIRE(s.control == ControlType::LocalPlayer);
  REQUIRE_FALSE(s.brake.has_value());
  REQUIRE_FALSE(s.track_length_m.has_value());
}

TEST_CASE("adapt_sample: garbage numbers become missing") {
  FieldMap f{{"lap", "x"}, {"lap_distance", "nan"}, {"speed", "12km"}, {"control", "9"}};
  const TelemetrySample s = adapt_sample(f, SourceSchema::SharedMemory);
  REQUIRE_FALSE(s.lap.has_value());
  REQUIRE_FALSE(s.lap_distance_m.has_value());
  REQUIRE_FALSE(s.speed_kmh.has_value());
  REQUIRE(s.control == ControlType::Nobody);
  REQUIRE(s.driver_name.empty());
}

TEST_CASE("schema_for_header picks the export schema on bracketed headers") {
  REQUIRE(schema_for_header({"t", "LapDistance [m]", "Speed [km/h]"}) == SourceSchema::ExportColumns);
  REQUIRE(schema_for_header({"t", "lap", "lap_distance"}) == SourceSchema::SharedMemory);
}

TEST_CASE("control codes") {
  REQUIRE(control_from_int(-1) == ControlType::Nobody);
  REQUIRE(control_from_int(1) == ControlType::AI);
  REQUIRE(control_from_int(3) == ControlType::Replay);
  REQUIRE(std::string(control_name(ControlType::Remote)) == "remote");
}

TEST_CASE("csv helpers") {
  REQUIRE(trim("  a b \t") == "a b");
  REQUIRE(split_csv_line(" a , b,,c ") == std::vector<std::string>{"a", "b", "", "c"});
  REQUIRE(parse_double(" 3.25 ").value() == Approx(3.25));
  REQUIRE_FALSE(parse_double("").has_value());
  REQUIRE_FALSE(parse_double("inf").has_value());
  REQUIRE(parse_int("2.6") == 3);
  REQUIRE(parse_bool("Yes") == true);
  REQUIRE(parse_bool("off") == false);
  REQUIRE_FALSE(parse_bool("maybe").has_value());
}
