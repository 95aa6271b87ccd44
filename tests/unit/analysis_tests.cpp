#include <doctest/doctest.h>
#include <leastpriv/analysis.hpp>

#include <memory>

using namespace leastpriv;

namespace {

PermissionMapIndex make_index() {
    EndpointEntry users;
    users.canonical_path = "/users";
    users.methods.push_back({"GET", {{"User.Read.All", ScopeType::Application, false},
                                     {"User.ReadBasic.All", ScopeType::Application, true}}});

    EndpointEntry messages;
    messages.canonical_path = "/users/{user-id}/messages";
    messages.methods.push_back({"GET", {{"Mail.ReadBasic.All", ScopeType::Application, true},
                                        {"Mail.Read", ScopeType::Delegated, true}}});

    return PermissionMapIndex({users, messages}, {});
}

SelectionResult selection_of(std::vector<std::string> names) {
    SelectionResult s;
    for (const auto& n : names) {
        s.selected.push_back({{n, ScopeType::Application, true}, 1});
    }
    return s;
}

class StaticSource : public ActivityLogSource {
public:
    QueryResult query(const std::string& principal_id, const ActivityWindow&) const override {
        QueryResult r;
        if (principal_id == "sp-denied") {
            r.error = QueryError::Other;
            r.message = "denied";
            return r;
        }
        r.rows = {{"GET", "https://graph.microsoft.com/v1.0/users"},
                  {"GET", "https://graph.microsoft.com/v1.0/users/1/messages"},
                  {"GET", "https://graph.microsoft.com/v1.0/users/2/messages"},
                  {"GET", "https://graph.microsoft.com/v1.0/sites"}};
        return r;
    }
};

Application make_app(const std::string& id, const std::string& principal,
                     std::vector<std::string> permissions) {
    Application app;
    app.id = id;
    app.principal_id = principal;
    app.display_name = id;
    app.current_permissions = std::move(permissions);
    return app;
}

} // namespace

// ============================================================================
// Permission Delta
// ============================================================================

TEST_CASE("compute_permission_delta: excess and required") {
    auto delta = compute_permission_delta({"User.Read.All", "Mail.Read", "Sites.FullControl.All"},
                                          selection_of({"User.Read.All", "Mail.ReadBasic.All"}));

    std::vector<std::string> excess = {"Mail.Read", "Sites.FullControl.All"};
    std::vector<std::string> required = {"Mail.ReadBasic.All"};
    CHECK(delta.excess == excess);
    CHECK(delta.required == required);
}

TEST_CASE("compute_permission_delta: names compare case-insensitively") {
    auto delta = compute_permission_delta({"user.read.all"}, selection_of({"User.Read.All"}));
    CHECK(delta.excess.empty());
    CHECK(delta.required.empty());
}

TEST_CASE("compute_permission_delta: duplicates are reported once") {
    auto delta = compute_permission_delta({"Mail.Read", "Mail.Read"}, selection_of({}));
    REQUIRE(delta.excess.size() == 1);
    CHECK(delta.excess[0] == "Mail.Read");
}

// ============================================================================
// Analysis Pipeline
// ============================================================================

TEST_CASE("analyze_activity: match, select and compare") {
    auto index = make_index();
    auto app = make_app("app-1", "sp-1", {"User.Read.All", "Mail.ReadBasic.All"});

    std::vector<RawActivity> activity = {
        {"GET", "https://graph.microsoft.com/v1.0/users"},
        {"GET", "https://graph.microsoft.com/v1.0/users/{id}/messages"},
        {"GET", "https://graph.microsoft.com/v1.0/sites"},
    };

    auto a = analyze_activity(app, activity, index);
    CHECK(a.ok);
    CHECK(a.activity.size() == 3);
    CHECK(a.activity_permissions.size() == 3);
    CHECK(a.selection.total_activities == 3);
    CHECK(a.selection.matched_activities == 2);
    CHECK_FALSE(a.matched_all_activity);
    REQUIRE(a.selection.unmatched_activities.size() == 1);
    CHECK(a.selection.unmatched_activities[0].path == "/sites");

    std::vector<std::string> selected = selected_permission_names(a.selection);
    REQUIRE(selected.size() == 2);
    CHECK(a.delta.excess == std::vector<std::string>{"User.Read.All"});
    CHECK(a.delta.required == std::vector<std::string>{"User.ReadBasic.All"});
}

TEST_CASE("analyze_activity: no activity means every grant is excess") {
    auto a = analyze_activity(make_app("app", "sp", {"Mail.Read"}), {}, make_index());
    CHECK(a.ok);
    CHECK(a.matched_all_activity);
    CHECK(a.selection.selected.empty());
    CHECK(a.delta.excess == std::vector<std::string>{"Mail.Read"});
}

TEST_CASE("analyze_application: collects then analyzes") {
    StaticSource source;
    ActivityCollector collector(source);
    auto index = make_index();
    ActivityWindow window{Clock::from_time_t(0), Clock::from_time_t(86400 * 30), 1000};

    auto a = analyze_application(make_app("app-1", "sp-1", {}), collector, index, window);
    CHECK(a.ok);
    CHECK(a.queries == 1);
    // two message URIs collapse into one activity
    CHECK(a.activity.size() == 3);
    CHECK(a.selection.matched_activities == 2);
}

TEST_CASE("analyze_application: collection failure is reported on the application") {
    StaticSource source;
    ActivityCollector collector(source);
    ActivityWindow window{Clock::from_time_t(0), Clock::from_time_t(86400), 1000};

    auto a = analyze_application(make_app("app-2", "sp-denied", {}), collector, make_index(), window);
    CHECK_FALSE(a.ok);
    CHECK(a.error == "denied");
    CHECK(a.application.id == "app-2");
}

TEST_CASE("analyze_applications: one result per application") {
    ActivityWindow window{Clock::from_time_t(0), Clock::from_time_t(86400), 1000};
    auto context = std::make_shared<const AnalysisContext>(std::make_shared<StaticSource>(),
                                                           CollectorOptions{}, make_index(), window);

    SchedulerOptions options;
    options.workers = 2;
    CollectionScheduler scheduler(options);

    std::vector<Application> apps = {make_app("a", "sp-1", {}), make_app("b", "sp-denied", {}),
                                     make_app("c", "sp-3", {})};
    auto batch = analyze_applications(apps, context, scheduler);

    CHECK(batch.submitted == 3);
    CHECK_FALSE(batch.timed_out);
    REQUIRE(batch.completed.size() == 3);

    size_t failed = 0;
    for (const auto& a : batch.completed) {
        if (!a.ok) ++failed;
    }
    CHECK(failed == 1);
}

TEST_CASE("analyze_applications: tasks share the context") {
    ActivityWindow window{Clock::from_time_t(0), Clock::from_time_t(86400), 1000};
    auto context = std::make_shared<const AnalysisContext>(std::make_shared<StaticSource>(),
                                                           CollectorOptions{}, make_index(), window);
    std::weak_ptr<const AnalysisContext> watch = context;

    CollectionScheduler scheduler;
    auto batch = analyze_applications({make_app("a", "sp-1", {})}, std::move(context), scheduler);

    REQUIRE(batch.completed.size() == 1);
    CHECK(batch.completed[0].ok);
    // released once the workers have finished with it
    CHECK(watch.expired());
}
