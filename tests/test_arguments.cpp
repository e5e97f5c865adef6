#include <doctest.h>

#include "cli/arguments.hpp"
#include "config/ap_settings.hpp"
#include "config/config_reconciler.hpp"
#include "core/errors.hpp"

#include "temporary_directory.hpp"

#include <string>
#include <vector>

using namespace captureap;

namespace
{
    // Owns argv storage the way the process would hand it to main
    class CommandLine
    {
    public:
        CommandLine(std::initializer_list<std::string> words): words_(words)
        {
            for (auto &word : words_)
            {
                pointers_.push_back(word.data());
            }
            pointers_.push_back(nullptr);
        }

        cli::Arguments parse()
        {
            return cli::parse_arguments(static_cast<int>(words_.size()), pointers_.data());
        }

    private:
        std::vector<std::string> words_;
        std::vector<char *> pointers_;
    };

    cli::Arguments parse(std::initializer_list<std::string> words)
    {
        CommandLine line(words);
        return line.parse();
    }
}

TEST_SUITE_BEGIN("Command line");

TEST_CASE("No arguments prints usage and fails")
{
    auto args = parse({"capture_ap"});

    CHECK(args.action == cli::Action::ShowUsage);
    REQUIRE(cli::early_exit_status(args).has_value());
    CHECK(*cli::early_exit_status(args) == 1);
}

TEST_CASE("Help fails like usage")
{
    SUBCASE("Short")
    {
        auto args = parse({"capture_ap", "-h"});
        CHECK(args.action == cli::Action::ShowHelp);
        CHECK(cli::early_exit_status(args) == std::optional<int>(1));
    }

    SUBCASE("Long, next to interfaces")
    {
        auto args = parse({"capture_ap", "--help", "eth0", "wlan1"});
        CHECK(args.action == cli::Action::ShowHelp);
        CHECK(cli::early_exit_status(args) == std::optional<int>(1));
    }
}

TEST_CASE("Version succeeds")
{
    auto args = parse({"capture_ap", "--version"});

    CHECK(args.action == cli::Action::ShowVersion);
    CHECK(cli::early_exit_status(args) == std::optional<int>(0));
}

TEST_CASE("Two interfaces bring the access point up")
{
    auto args = parse({"capture_ap", "-v", "-v", "-e", "10.0.0.50", "eth0", "wlan1"});

    CHECK(args.action == cli::Action::BringUp);
    CHECK_FALSE(cli::early_exit_status(args).has_value());
    CHECK(args.verbosity == 2);
    CHECK(args.dhcp_end == std::optional<std::string>("10.0.0.50"));
    REQUIRE(args.interfaces.size() == 2);
    CHECK(args.interfaces[0] == "eth0");
    CHECK(args.interfaces[1] == "wlan1");
}

TEST_CASE("Long options and their values")
{
    auto args = parse({"capture_ap", "--apaddress", "192.168.4.1", "--dhcplease=24h", "--config", "/tmp/ap.json",
                       "--log-file", "/tmp/ap.log", "eth0", "wlan1"});

    CHECK(args.action == cli::Action::BringUp);
    CHECK(args.ap_address == std::optional<std::string>("192.168.4.1"));
    CHECK(args.lease_time == std::optional<std::string>("24h"));
    CHECK(args.config_file == "/tmp/ap.json");
    CHECK(args.log_file == "/tmp/ap.log");
    CHECK_FALSE(args.dhcp_start.has_value());
    CHECK_FALSE(args.netmask.has_value());
}

TEST_CASE("Interface count other than two is a usage error")
{
    SUBCASE("One")
    {
        auto args = parse({"capture_ap", "wlan1"});
        CHECK(args.action == cli::Action::ShowUsage);
    }

    SUBCASE("Three")
    {
        auto args = parse({"capture_ap", "eth0", "wlan0", "wlan1"});
        CHECK(args.action == cli::Action::ShowUsage);
    }

    SUBCASE("Options only")
    {
        auto args = parse({"capture_ap", "-s", "10.0.0.30"});
        CHECK(args.action == cli::Action::ShowUsage);
    }

    auto args = parse({"capture_ap", "eth0"});
    CHECK(cli::early_exit_status(args) == std::optional<int>(1));
}

TEST_CASE("Options after the first interface name are not parsed")
{
    auto args = parse({"capture_ap", "eth0", "wlan1", "-a", "not-an-address"});

    CHECK(args.action == cli::Action::ShowUsage);
    CHECK_FALSE(args.ap_address.has_value());
    REQUIRE(args.interfaces.size() == 4);
    CHECK(args.interfaces[2] == "-a");
    CHECK(args.interfaces[3] == "not-an-address");
}

TEST_CASE("Remove needs no interfaces")
{
    SUBCASE("Alone")
    {
        auto args = parse({"capture_ap", "-r"});
        CHECK(args.action == cli::Action::Remove);
        CHECK_FALSE(cli::early_exit_status(args).has_value());
    }

    SUBCASE("With interfaces")
    {
        auto args = parse({"capture_ap", "--remove", "eth0", "wlan1"});
        CHECK(args.action == cli::Action::Remove);
    }
}

TEST_CASE("Malformed option values are validation errors")
{
    CHECK_THROWS_AS(parse({"capture_ap", "-a", "10.0.0", "eth0", "wlan1"}), core::ValidationError);
    CHECK_THROWS_AS(parse({"capture_ap", "-s", "10.0.0.256", "eth0", "wlan1"}), core::ValidationError);
    CHECK_THROWS_AS(parse({"capture_ap", "-n", "mask", "eth0", "wlan1"}), core::ValidationError);
    CHECK_THROWS_AS(parse({"capture_ap", "-l", "12", "eth0", "wlan1"}), core::ValidationError);
    CHECK_THROWS_AS(parse({"capture_ap", "--dhcplease", "1000h", "eth0", "wlan1"}), core::ValidationError);
}

TEST_CASE("Parsing twice in one process starts from the beginning")
{
    parse({"capture_ap", "-r"});
    auto args = parse({"capture_ap", "-l", "6h", "eth0", "wlan1"});

    CHECK(args.action == cli::Action::BringUp);
    CHECK(args.lease_time == std::optional<std::string>("6h"));
}

TEST_CASE("Flags override persisted values")
{
    test::TemporaryDirectory directory;
    const auto hostapd_path = directory / "hostapd.conf";
    const auto dnsmasq_path = directory / "dnsmasq.conf";
    test::write_text(dnsmasq_path,
                     "interface=wlan1\n"
                     "dhcp-range=192.168.4.10,192.168.4.99,255.255.255.0,24h\n"
                     "dhcp-option=3,192.168.4.1\n"
                     "dhcp-option=6,192.168.4.1\n");

    config::ConfigReconciler reconciler(hostapd_path, dnsmasq_path);
    config::ApSettings settings;
    reconciler.load_persisted(settings);

    auto args = parse({"capture_ap", "-e", "192.168.4.50", "-l", "2h", "eth0", "wlan0"});
    cli::apply_overrides(args, settings);

    CHECK(settings.dhcp_end == "192.168.4.50");
    CHECK(settings.lease_time == "2h");
    CHECK(settings.dhcp_start == "192.168.4.10");
    CHECK(settings.netmask == "255.255.255.0");
    CHECK(settings.ap_address == "192.168.4.1");
    CHECK(settings.internet_interface == "eth0");
    CHECK(settings.ap_interface == "wlan0");
}

TEST_SUITE_END();
