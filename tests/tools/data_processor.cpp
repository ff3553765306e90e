#include "toolgate/tools/data_processor.hpp"

#include "toolgate/exceptions.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace toolgate;
using namespace toolgate::tools;

int main()
{
    std::cout << "Running data processor tests...\n";

    const Json people = Json::parse(R"([
        {"name": "ann", "age": 31, "team": "red"},
        {"name": "bob", "age": 25, "team": "blue"},
        {"name": "cid", "age": 42, "team": "red"},
        {"name": "dee", "age": 25, "team": "green"}
    ])");

    // filter
    {
        auto r = process_data(people, "filter",
                              Json{{"field", "age"}, {"operator", ">="}, {"value", 30}});
        assert(r["success"] == true);
        assert(r["input_count"] == 4);
        assert(r["result"].size() == 2);
        assert(r["result"][0]["name"] == "ann");

        r = process_data(people, "filter",
                         Json{{"field", "team"}, {"operator", "in"},
                              {"value", Json::array({"blue", "green"})}});
        assert(r["result"].size() == 2);

        r = process_data(people, "filter",
                         Json{{"field", "name"}, {"operator", "contains"}, {"value", "e"}});
        assert(r["result"].size() == 1 && r["result"][0]["name"] == "dee");

        // Ordering between a string and a number matches nothing
        r = process_data(people, "filter", Json{{"field", "name"}, {"operator", ">"}, {"value", 1}});
        assert(r["result"].empty());

        r = process_data(people, "filter", Json{{"field", "age"}, {"operator", "~"}, {"value", 1}});
        assert(r["success"] == false);
        std::cout << "  [PASS] filter\n";
    }

    // map, reduce, sort
    {
        auto names = process_data(people, "map", Json{{"field", "name"}})["result"];
        assert((names == Json::array({"ann", "bob", "cid", "dee"})));

        const Json nums = Json::array({3, 1, 2, 4});
        assert(process_data(nums, "reduce", Json{{"reduce_operation", "sum"}})["result"] == 10);
        assert(process_data(nums, "reduce", Json{{"reduce_operation", "product"}})["result"] == 24);
        assert(process_data(nums, "reduce", Json{{"reduce_operation", "count"}})["result"] == 4);
        assert(process_data(Json::array({"a", "b"}), "reduce",
                            Json{{"reduce_operation", "concat"}})["result"] == "ab");
        assert(process_data(Json::array({1, "x"}), "reduce")["success"] == false);

        assert((process_data(nums, "sort")["result"] == Json::array({1, 2, 3, 4})));
        assert((process_data(nums, "sort", Json{{"reverse", true}})["result"] ==
                Json::array({4, 3, 2, 1})));
        auto by_age = process_data(people, "sort", Json{{"key", "age"}})["result"];
        assert(by_age[0]["name"] == "bob" && by_age[1]["name"] == "dee");
        assert(by_age[3]["name"] == "cid");
        std::cout << "  [PASS] map, reduce, sort\n";
    }

    // group, aggregate, unique, sample
    {
        auto groups = process_data(people, "group", Json{{"field", "team"}})["result"];
        assert(groups["red"].size() == 2 && groups["blue"].size() == 1);

        auto agg = process_data(people, "aggregate",
                                Json{{"field", "age"},
                                     {"aggregations",
                                      Json::array({"count", "sum", "avg", "min", "max", "median",
                                                   "mode"})}})["result"];
        assert(agg["count"] == 4 && agg["sum"] == 123);
        assert(agg["min"] == 25 && agg["max"] == 42 && agg["mode"] == 25);
        assert(agg["median"] == 28.0);
        assert(std::fabs(agg["avg"].get<double>() - 30.75) < 1e-9);

        auto unique = process_data(people, "unique", Json{{"field", "age"}})["result"];
        assert(unique.size() == 3);
        assert((process_data(Json::array({1, 1, 2, "2"}), "unique")["result"].size() == 2));

        auto a = process_data(people, "sample", Json{{"size", 2}, {"seed", 7}})["result"];
        auto b = process_data(people, "sample", Json{{"size", 2}, {"seed", 7}})["result"];
        assert(a.size() == 2 && a == b);
        assert(process_data(people, "sample", Json{{"size", 10}})["result"].size() == 4);
        std::cout << "  [PASS] group, aggregate, unique, sample\n";
    }

    // statistics
    {
        auto s = process_data(Json::array({2, 4, 4, 4, 5, 5, 7, 9}), "statistics")["result"];
        assert(s["count"] == 8 && s["sum"] == 40);
        assert(s["mean"] == 5.0 && s["median"] == 4.5);
        assert(s["min"] == 2 && s["max"] == 9 && s["range"] == 7);
        assert(std::fabs(s["variance"].get<double>() - 32.0 / 7.0) < 1e-9);
        assert(s["q1"] == 4 && s["q3"] == 7 && s["iqr"] == 3);
        assert(s["frequency"]["4"] == 3);

        auto none = compute_statistics(Json::array({"a", true}));
        assert(none.contains("error"));
        std::cout << "  [PASS] statistics\n";
    }

    // invalid input
    {
        auto r = process_data(Json{{"not", "a list"}}, "sort");
        assert(r["success"] == false && r["error"] == "data must be a list");
        r = process_data(people, "explode");
        assert(r["success"] == false);
        assert(r["available_operations"].size() == 9);

        auto tool = make_data_processor_tool();
        bool threw = false;
        try
        {
            tool.invoke(Json{{"data", people}});
        }
        catch (const ValidationError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "  [PASS] invalid input\n";
    }

    std::cout << "All data processor tests passed\n";
    return 0;
}
