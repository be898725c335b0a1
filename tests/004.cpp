#include "utils.hpp"

namespace envprobe::test {
    using namespace std::string_view_literals;

    TEST_CASE("004: diff reports additions and changes only", "[004][diff]") {
        env_snapshot before{{"HOME", "/home/me"}, {"KEEP", "same"}, {"CHANGED", "old"}, {"GONE", "1"}};
        env_snapshot after{{"HOME", "/home/me"}, {"KEEP", "same"}, {"CHANGED", "new"}, {"ADDED", "yes"}};

        auto delta = diff_snapshots(before, after);
        CHECK(delta == env_delta{{"ADDED", "yes"}, {"CHANGED", "new"}});
        CHECK_FALSE(delta.contains("GONE"));
        CHECK_FALSE(delta.contains("KEEP"));
    }

    TEST_CASE("004: diff compares values byte for byte", "[004][diff]") {
        env_snapshot before{{"A", "x"}, {"B", ""}, {"C", "1"}};
        env_snapshot after{{"A", "x "}, {"B", ""}, {"C", "01"}};

        auto delta = diff_snapshots(before, after);
        CHECK(delta == env_delta{{"A", "x "}, {"C", "01"}});
    }

    TEST_CASE("004: diff edge cases", "[004][diff]") {
        CHECK(diff_snapshots({}, {}).empty());
        CHECK(diff_snapshots({{"ONLY_BEFORE", "1"}}, {}).empty());
        CHECK(diff_snapshots({}, {{"EMPTY", ""}}) == env_delta{{"EMPTY", ""}});

        env_snapshot same{{"PATH", "/usr/bin"}, {"LANG", "C"}};
        CHECK(diff_snapshots(same, same).empty());
    }

    TEST_CASE("004: environ parsing", "[004][snapshot]") {
        std::string a{"FOO=bar"};
        std::string b{"EMPTY="};
        std::string c{"EQ=a=b=c"};
        std::string d{"NOEQUALS"};
        std::string e{"=leading"};
        std::string f{"FOO=shadowed"};
        std::vector<char*> envp{a.data(), b.data(), c.data(), d.data(), e.data(), f.data(), nullptr};

        auto snapshot = snapshot_from_environ(envp.data());
        CHECK(snapshot == env_snapshot{{"FOO", "bar"}, {"EMPTY", ""}, {"EQ", "a=b=c"}});
        CHECK(snapshot_from_environ(nullptr).empty());
    }

    TEST_CASE("004: current environment is visible to the snapshot", "[004][snapshot]") {
        detail::scoped_env_var var{"ENVPROBE_004_MARKER", "marker value"};

        auto snapshot = current_environment();
        REQUIRE(snapshot.contains("ENVPROBE_004_MARKER"));
        CHECK(snapshot.at("ENVPROBE_004_MARKER") == "marker value");
    }

    TEST_CASE("004: snapshot files", "[004][snapshot]") {
        detail::temp_dir dir{"envprobe_004_snapshot"};

        SECTION("written snapshots read back unchanged") {
            env_snapshot snapshot{
                    {"MULTILINE", "line one\nline two"},
                    {"QUOTES", R"(she said "hi" and it's \ fine)"},
                    {"UNICODE", "caf\xc3\xa9"},
                    {"EMPTY", ""}};
            auto path = dir.path / "snapshot.json";

            write_env_snapshot(snapshot, path);
            CHECK(read_env_snapshot(path) == snapshot);
        }

        SECTION("probe side writes the live environment") {
            detail::scoped_env_var var{"ENVPROBE_004_PROBE", "from the probe"};
            auto path = dir.path / "live.json";

            write_env_snapshot(path);
            auto snapshot = read_env_snapshot(path);
            REQUIRE(snapshot.contains("ENVPROBE_004_PROBE"));
            CHECK(snapshot.at("ENVPROBE_004_PROBE") == "from the probe");
        }

        SECTION("missing file") {
            try {
                (void)read_env_snapshot(dir.path / "absent.json");
                FAIL("expected capture_error");
            } catch (const capture_error& e) {
                CHECK(e.kind() == capture_error_kind::snapshot_parse);
            }
        }

        SECTION("empty file") {
            auto path = dir.path / "empty.json";
            detail::write_text_file(path, "");
            try {
                (void)read_env_snapshot(path);
                FAIL("expected capture_error");
            } catch (const capture_error& e) {
                CHECK(e.kind() == capture_error_kind::snapshot_parse);
                CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("empty"));
            }
        }
    }

    TEST_CASE("004: malformed snapshots are rejected", "[004][snapshot]") {
        for (auto text : {"{"sv, "not json"sv, R"({"A": 1})"sv, R"(["A", "B"])"sv, R"({"A": {"nested": "x"}})"sv}) {
            CAPTURE(text);
            CHECK_THROWS_AS(parse_env_snapshot(text), capture_error);
        }
        CHECK(parse_env_snapshot(R"( {"A": "1", "B": ""} )"sv) == env_snapshot{{"A", "1"}, {"B", ""}});
        CHECK(parse_env_snapshot("{}"sv).empty());
    }

    TEST_CASE("004: probe command", "[004][snapshot]") {
        CHECK(probe_snapshot_command("/usr/bin/envprobe", "/tmp/envprobe_abc") ==
              command{"/usr/bin/envprobe", "--dump-env", "/tmp/envprobe_abc"});
    }

}  // namespace envprobe::test
