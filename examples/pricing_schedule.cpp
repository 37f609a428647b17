#include <schedexpr/catalog.hpp>
#include <schedexpr/schedule.hpp>

#include <iostream>
#include <vector>

using namespace schedexpr;

static void print_row(const TimePoint& t, const std::vector<Schedule>& schedules) {
    std::cout << to_string(t);
    for (const auto& s : schedules) std::cout << "\t" << (matches(s, t) ? "fire" : "-");
    std::cout << "\n";
}

int main() {
    // 1) Every Wednesday at 6:00 and 12:00, and at 5:30, 6:30 and 7:30 every Thursday.
    Schedule wednesday = days_of_the_week({DayOfWeek::Wednesday}) & hours_of_the_day({6, 12}) &
                         minutes_of_the_hour({0});
    Schedule thursday = days_of_the_week({DayOfWeek::Thursday}) & hours_of_the_day({5, 6, 7}) &
                        minutes_of_the_hour({30});
    Schedule pricing = wednesday | thursday;
    std::cout << "pricing  = " << pricing << "\n";

    // 2) The same schedule written as unions only fires far more often:
    //    any Wednesday, any minute of 6am, every half hour...
    Schedule unions = days_of_the_week({3}) | hours_of_the_day({6, 12}) |
                      (days_of_the_week({4}) | (hours_of_the_day({5, 7}) | minutes_of_the_hour({30})));
    std::cout << "unions   = " << unions << "\n";

    // 3) From text, as a configuration file would declare it.
    Catalog catalog;
    catalog.define("wednesday = days(wed) & hours(6, 12) & minutes(0)");
    catalog.define("thursday = days(thu) & hours(5, 6, 7) & minutes(30)");
    const Schedule& parsed = catalog.define("pricing = wednesday | thursday");
    std::cout << "parsed   = " << parsed << "\n\n";

    std::vector<Schedule> columns{pricing, unions, parsed};
    std::cout << "time\t\t\t\tpricing\tunions\tparsed\n";
    print_row(parse_time_point("2024-05-01 06:00"), columns); // Wednesday
    print_row(parse_time_point("2024-05-01 06:15"), columns);
    print_row(parse_time_point("2024-05-02 06:30"), columns); // Thursday
    print_row(parse_time_point("2024-05-03 09:30"), columns); // Friday
    print_row(parse_time_point("2024-05-03 09:15"), columns);

    return 0;
}
