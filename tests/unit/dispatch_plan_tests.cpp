#include <doctest/doctest.h>
#include <appdesk/dispatch.hpp>

using namespace appdesk;

TEST_CASE("empty invocation is a help request") {
    Invocation inv;
    auto plan = plan_invocation(inv);
    CHECK(plan.action == Action::Help);
    CHECK_FALSE(plan.install_first);

    inv.json = true;
    inv.quiet = true;
    CHECK(plan_invocation(inv).action == Action::Help);
}

TEST_CASE("help wins over every other flag") {
    Invocation inv;
    inv.help = true;
    inv.show_name = "Foo";
    inv.install_package = true;
    inv.list = true;
    inv.create = true;
    inv.bundles = {"Foo"};

    auto plan = plan_invocation(inv);
    CHECK(plan.action == Action::Help);
    CHECK_FALSE(plan.install_first);
}

TEST_CASE("show runs before install and list") {
    Invocation inv;
    inv.show_name = "Foo";
    inv.install_package = true;
    inv.list = true;

    auto plan = plan_invocation(inv);
    CHECK(plan.action == Action::Show);
    CHECK_FALSE(plan.install_first);
}

TEST_CASE("install continues into list") {
    Invocation inv;
    inv.install_package = true;
    inv.list = true;
    inv.bundles = {"Foo"};

    auto plan = plan_invocation(inv);
    CHECK(plan.action == Action::List);
    CHECK(plan.install_first);
}

TEST_CASE("remove comes after list") {
    Invocation inv;
    inv.remove_name = "Foo";
    CHECK(plan_invocation(inv).action == Action::Remove);

    inv.list = true;
    CHECK(plan_invocation(inv).action == Action::List);
}

TEST_CASE("bundle arguments imply create") {
    Invocation inv;
    inv.bundles = {"Foo"};
    auto plan = plan_invocation(inv);
    CHECK(plan.action == Action::Process);
    CHECK(plan.create_descriptors);
    CHECK_FALSE(plan.install_first);

    Invocation flag_only;
    flag_only.create = true;
    CHECK(plan_invocation(flag_only).action == Action::Process);
    CHECK(plan_invocation(flag_only).create_descriptors);
}

TEST_CASE("install alone continues into the bundle pass without descriptors") {
    Invocation inv;
    inv.install_package = true;
    auto plan = plan_invocation(inv);
    CHECK(plan.action == Action::Process);
    CHECK(plan.install_first);
    CHECK_FALSE(plan.create_descriptors);

    inv.create = true;
    CHECK(plan_invocation(inv).create_descriptors);
}

TEST_CASE("list and remove never create descriptors") {
    Invocation inv;
    inv.list = true;
    inv.create = true;
    CHECK_FALSE(plan_invocation(inv).create_descriptors);

    Invocation remove;
    remove.remove_name = "Foo";
    remove.create = true;
    CHECK(plan_invocation(remove).action == Action::Remove);
    CHECK_FALSE(plan_invocation(remove).create_descriptors);
}

TEST_CASE("action_to_string") {
    CHECK(std::string(action_to_string(Action::Help)) == "help");
    CHECK(std::string(action_to_string(Action::Show)) == "show");
    CHECK(std::string(action_to_string(Action::Process)) == "process");
}
