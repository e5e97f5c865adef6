#include <doctest.h>

#include "config/config_reconciler.hpp"
#include "config/key_value_document.hpp"
#include "core/errors.hpp"
#include "core/run_state.hpp"
#include "services/access_point_service.hpp"

#include "fake_system_state.hpp"
#include "temporary_directory.hpp"

#include <algorithm>

using namespace captureap;

TEST_SUITE_BEGIN("Access point bring-up and teardown");

/*!
 * Test fixture: service on a fake machine with eth0, wlan0 and wlan1,
 * configuration and state files in a scratch directory.
 */
class AccessPointServiceFixture
{
  protected:
    test::TemporaryDirectory directory;
    std::shared_ptr<test::FakeSystemState> system;
    std::shared_ptr<config::ConfigReconciler> reconciler;
    std::shared_ptr<core::RunStateStore> run_state;
    services::AccessPointService service;
    config::ApSettings settings;

  public:
    explicit AccessPointServiceFixture():
        system(std::make_shared<test::FakeSystemState>()),
        reconciler(std::make_shared<config::ConfigReconciler>(directory / "hostapd.conf",
                                                              directory / "dnsmasq.conf")),
        run_state(std::make_shared<core::RunStateStore>(directory / "state" / "state.json")),
        service(system, reconciler, run_state)
    {
        settings.internet_interface = "eth0";
        settings.ap_interface = "wlan1";
    }

    std::string hostapd_path() const { return (directory / "hostapd.conf").string(); }
    std::string dnsmasq_path() const { return (directory / "dnsmasq.conf").string(); }

    bool configs_exist() const
    {
        return std::filesystem::exists(directory / "hostapd.conf") ||
               std::filesystem::exists(directory / "dnsmasq.conf");
    }

    bool queried(const std::string &prefix) const
    {
        const auto &queries = system->queries();
        return std::any_of(queries.begin(), queries.end(),
                           [&prefix](const std::string &q) { return q.compare(0, prefix.size(), prefix) == 0; });
    }
};

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Bring-up runs every step in order")
{
    service.bring_up(settings);

    const std::vector<std::string> expected = {
        "set_forwarding on",
        "add_masquerade_rule eth0",
        "set_interface_managed wlan1 no",
        "start_access_point " + hostapd_path(),
        "flush_addresses wlan1",
        "assign_address wlan1 10.0.0.1/24",
        "start_dhcp_server " + dnsmasq_path() + " wlan1",
    };
    CHECK(system->operations() == expected);
    CHECK(service.stage() == services::BringUpStage::Ready);

    CHECK(system->forwarding());
    CHECK(system->masquerade_rules() == std::set<std::string>{"eth0"});
    CHECK_FALSE(system->managed("wlan1"));
    CHECK(system->access_point_running());
    CHECK(system->addresses("wlan1") == std::vector<std::string>{"10.0.0.1/24"});
    CHECK(system->dhcp_server_running());

    auto state = run_state->load();
    CHECK(state.internet_interface == "eth0");
    CHECK(state.ap_interface == "wlan1");

    auto dnsmasq = config::KeyValueDocument::load(dnsmasq_path());
    REQUIRE(dnsmasq.has_value());
    CHECK(dnsmasq->get("interface") == "wlan1");
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Netmask decides the assigned prefix length")
{
    settings.netmask = "255.255.0.0";
    settings.ap_address = "172.16.0.1";

    service.bring_up(settings);

    CHECK(system->addresses("wlan1") == std::vector<std::string>{"172.16.0.1/16"});
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Bad interfaces are rejected before anything is touched")
{
    SUBCASE("Missing AP interface")
    {
        settings.ap_interface.clear();
    }
    SUBCASE("Unknown interface")
    {
        settings.internet_interface = "eth7";
    }
    SUBCASE("Same interface twice")
    {
        settings.internet_interface = "wlan1";
    }
    SUBCASE("Wired AP interface")
    {
        settings.internet_interface = "wlan0";
        settings.ap_interface = "eth0";
    }

    CHECK_THROWS_AS(service.bring_up(settings), core::ValidationError);

    CHECK(system->operations().empty());
    CHECK_FALSE(queried("is_access_point_running"));
    CHECK_FALSE(configs_exist());
    CHECK(run_state->load().empty());
    CHECK(service.stage() == services::BringUpStage::Idle);
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Netmask with holes is rejected before anything is touched")
{
    settings.netmask = "255.0.255.0";

    CHECK_THROWS_AS(service.bring_up(settings), core::ValidationError);

    CHECK(system->operations().empty());
    CHECK_FALSE(configs_exist());
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "DHCP range in reverse order only warns")
{
    settings.dhcp_start = "10.0.0.20";
    settings.dhcp_end = "10.0.0.10";

    CHECK_NOTHROW(service.bring_up(settings));
    CHECK(service.stage() == services::BringUpStage::Ready);
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Still-running AP is stopped before reconfiguring")
{
    system->set_access_point_running(true);

    service.bring_up(settings);

    REQUIRE(system->operations().size() > 2);
    CHECK(system->operations()[0] == "stop_access_point");
    CHECK(system->operations()[1] == "set_forwarding on");
    CHECK(system->access_point_running());
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Failed step stops bring-up without rolling back")
{
    system->fail("add_masquerade_rule");

    try
    {
        service.bring_up(settings);
        FAIL("bring-up should have failed");
    }
    catch (const core::ExternalCommandError &e)
    {
        CHECK(e.step() == "MasqueradeEnabled");
    }

    CHECK(system->operations() == std::vector<std::string>{"set_forwarding on", "add_masquerade_rule eth0"});
    CHECK(system->forwarding());
    CHECK(service.stage() == services::BringUpStage::RoutingEnabled);
    CHECK(run_state->load().empty());
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Each failing step is reported by name")
{
    std::string operation;
    std::string step;

    SUBCASE("Routing")
    {
        operation = "set_forwarding";
        step = "RoutingEnabled";
    }
    SUBCASE("Masquerade")
    {
        operation = "add_masquerade_rule";
        step = "MasqueradeEnabled";
    }
    SUBCASE("Interface release")
    {
        operation = "set_interface_managed";
        step = "InterfaceDetached";
    }
    SUBCASE("Beacon")
    {
        operation = "start_access_point";
        step = "BeaconLaunched";
    }
    SUBCASE("Address")
    {
        operation = "assign_address";
        step = "IPAssigned";
    }
    SUBCASE("DHCP")
    {
        operation = "start_dhcp_server";
        step = "DhcpRunning";
    }

    system->fail(operation, 7);

    try
    {
        service.bring_up(settings);
        FAIL("bring-up should have failed");
    }
    catch (const core::ExternalCommandError &e)
    {
        CHECK(e.step() == step);
        CHECK(e.exit_status() == 7);
    }
    CHECK(system->operations().back().compare(0, operation.size(), operation) == 0);
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Failure after the beacon is up can still be torn down")
{
    system->fail("assign_address");

    CHECK_THROWS_AS(service.bring_up(settings), core::ExternalCommandError);
    CHECK(service.stage() == services::BringUpStage::BeaconLaunched);

    auto state = run_state->load();
    CHECK(state.internet_interface == "eth0");
    CHECK(state.ap_interface == "wlan1");

    service.tear_down();

    CHECK_FALSE(system->forwarding());
    CHECK(system->masquerade_rules().empty());
    CHECK_FALSE(system->access_point_running());
    CHECK(system->managed("wlan1"));
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Flush failure is not fatal")
{
    system->fail("flush_addresses");

    CHECK_NOTHROW(service.bring_up(settings));
    CHECK(service.stage() == services::BringUpStage::Ready);
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Running bring-up twice leaves the same state")
{
    service.bring_up(settings);
    const auto hostapd_text = test::read_text(hostapd_path());
    const auto dnsmasq_text = test::read_text(dnsmasq_path());

    system->clear_history();
    service.bring_up(settings);

    CHECK(system->forwarding());
    CHECK(system->masquerade_rules() == std::set<std::string>{"eth0"});
    CHECK_FALSE(system->managed("wlan1"));
    CHECK(system->access_point_running());
    CHECK(system->addresses("wlan1") == std::vector<std::string>{"10.0.0.1/24"});
    CHECK(system->dhcp_server_running());

    CHECK(test::read_text(hostapd_path()) == hostapd_text);
    CHECK(test::read_text(dnsmasq_path()) == dnsmasq_text);

    const auto &operations = system->operations();
    CHECK(operations.front() == "stop_access_point");
    CHECK(std::count(operations.begin(), operations.end(), "add_masquerade_rule eth0") == 0);
    CHECK(std::count(operations.begin(), operations.end(), "stop_dhcp_server") == 1);
    CHECK(operations.back() == "start_dhcp_server " + dnsmasq_path() + " wlan1");
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Rule left by swapped interfaces is replaced")
{
    system->add_existing_masquerade_rule("wlan1");

    service.bring_up(settings);

    CHECK(system->masquerade_rules() == std::set<std::string>{"eth0"});
    REQUIRE(system->operations().size() > 2);
    CHECK(system->operations()[1] == "remove_masquerade_rule wlan1");
    CHECK(system->operations()[2] == "add_masquerade_rule eth0");
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Teardown without a recorded bring-up does nothing")
{
    CHECK_THROWS_AS(service.tear_down(), core::StateError);
    CHECK(system->operations().empty());
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Teardown reverses bring-up")
{
    service.bring_up(settings);
    system->clear_history();

    service.tear_down();

    const std::vector<std::string> expected = {
        "stop_access_point",
        "flush_addresses wlan1",
        "set_interface_managed wlan1 yes",
        "stop_dhcp_server",
        "remove_masquerade_rule eth0",
        "set_forwarding off",
    };
    CHECK(system->operations() == expected);

    CHECK_FALSE(system->forwarding());
    CHECK(system->masquerade_rules().empty());
    CHECK(system->managed("wlan1"));
    CHECK(system->addresses("wlan1").empty());
    CHECK_FALSE(system->access_point_running());
    CHECK_FALSE(system->dhcp_server_running());

    CHECK(run_state->load().empty());
    CHECK(service.stage() == services::BringUpStage::Idle);
    CHECK_THROWS_AS(service.tear_down(), core::StateError);
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Teardown uses the recorded interfaces")
{
    core::RunState state;
    state.internet_interface = "wlan0";
    state.ap_interface = "wlan1";
    run_state->save(state);
    system->add_existing_masquerade_rule("wlan0");

    service.tear_down();

    CHECK(system->masquerade_rules().empty());
    CHECK(std::count(system->operations().begin(), system->operations().end(),
                     "set_interface_managed wlan1 yes") == 1);
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Teardown skips a rule that is already gone")
{
    service.bring_up(settings);
    system->remove_masquerade_rule("eth0");
    system->clear_history();

    service.tear_down();

    const auto &operations = system->operations();
    CHECK(std::count(operations.begin(), operations.end(), "remove_masquerade_rule eth0") == 0);
    CHECK(operations.back() == "set_forwarding off");
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Teardown keeps going past failed steps")
{
    service.bring_up(settings);
    system->clear_history();
    system->fail("stop_access_point");
    system->fail("set_interface_managed");

    CHECK_NOTHROW(service.tear_down());

    CHECK(system->operations().size() == 6);
    CHECK_FALSE(system->forwarding());
    CHECK_FALSE(system->dhcp_server_running());
    CHECK(run_state->load().empty());
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Environment check requires root")
{
    system->set_privileged(false);

    CHECK_THROWS_AS(service.check_environment(), core::PrivilegeError);
    CHECK(system->operations().empty());
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Environment check names every missing tool")
{
    system->remove_executable("hostapd");
    system->remove_executable("nmcli");

    CHECK_THROWS_WITH_AS(service.check_environment(), "Missing required tools: hostapd, nmcli",
                         core::DependencyError);
}

TEST_CASE_FIXTURE(AccessPointServiceFixture, "Environment check passes with everything installed")
{
    CHECK_NOTHROW(service.check_environment());
    for (const auto &executable : services::AccessPointService::required_executables())
    {
        CHECK(queried("has_executable " + executable));
    }
}

TEST_CASE("Summary lists the network the operator just created")
{
    config::ApSettings settings;
    settings.ssid = "Lab";
    settings.dhcp_end = "10.0.0.50";

    auto summary = services::AccessPointService::format_summary(settings);

    CHECK(summary.find("Network Name: Lab") != std::string::npos);
    CHECK(summary.find("IP Address: 10.0.0.1") != std::string::npos);
    CHECK(summary.find("Netmask: 255.255.255.0") != std::string::npos);
    CHECK(summary.find("DHCP Start: 10.0.0.10") != std::string::npos);
    CHECK(summary.find("DHCP End: 10.0.0.50") != std::string::npos);
    CHECK(summary.find("DHCP Lease Time: 12h") != std::string::npos);
    CHECK(summary.find("--remove") != std::string::npos);
}

TEST_CASE("Stage names")
{
    CHECK(services::to_string(services::BringUpStage::Idle) == "Idle");
    CHECK(services::to_string(services::BringUpStage::BeaconLaunched) == "BeaconLaunched");
    CHECK(services::to_string(services::BringUpStage::Ready) == "Ready");
}

TEST_SUITE_END();
