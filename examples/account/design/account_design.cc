#include <svcgen/dsl.hh>

SVCGEN_DESIGN(cellar) {
    using namespace svcgen::dsl;

    api("cellar", [] {
        title("The virtual wine cellar");
        version("1.0");
        description("Cellar is a service for storing wine bottles of registered accounts.");
    });

    service("account", [] {
        description("The account service manages the cellar accounts.");

        method("create", [] {
            description("Create a new account.");
            http("POST", "/accounts");
        });

        method("list", [] {
            description("List all accounts.");
            http("GET", "/accounts");
        });

        method("show", [] {
            description("Retrieve the account with the given id.");
            http("GET", "/accounts/{id}");
        });

        method("delete", [] {
            description("Delete the account with the given id.");
            http("DELETE", "/accounts/{id}");
        });
    });
}
