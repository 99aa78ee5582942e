//
// Unit tests for the transport runtime used by generated code
//

#include <doctest/doctest.h>
#include <svcgen/rest.hh>

#include <string>

using namespace svcgen::rest;

namespace {

/// Doer answering every request with its own path.
class EchoDoer : public Doer {
public:
    Response execute(const Request& request) override {
        last = request;
        return Response{200, {}, request.method + " " + request.host + request.path};
    }

    Request last;
};

}  // namespace

TEST_SUITE("Rest - ServeMux") {

    TEST_CASE("Dispatch by method and path") {
        ServeMux mux;
        mux.handle("GET", "/accounts", [](const Request&) { return Response{200, {}, "list"}; });
        mux.handle("POST", "/accounts", [](const Request&) { return Response{201, {}, "create"}; });
        mux.handle("GET", "/accounts/{id}", [](const Request& r) {
            return Response{200, {}, "show " + r.params.at("id")};
        });
        CHECK(mux.size() == 3);

        CHECK(mux.serve(Request{"GET", "", "/accounts", {}, {}, ""}).body == "list");
        CHECK(mux.serve(Request{"POST", "", "/accounts/", {}, {}, ""}).status == 201);
        CHECK(mux.serve(Request{"GET", "", "/accounts/42", {}, {}, ""}).body == "show 42");
    }

    TEST_CASE("Unmatched requests") {
        ServeMux mux;
        mux.handle("GET", "/accounts/{id}", [](const Request&) { return Response{200, {}, ""}; });

        SUBCASE("Unknown path") {
            CHECK(mux.serve(Request{"GET", "", "/bottles/1", {}, {}, ""}).status == 404);
            CHECK(mux.serve(Request{"GET", "", "/accounts/1/extra", {}, {}, ""}).status == 404);
        }

        SUBCASE("Known path, other method") {
            CHECK(mux.serve(Request{"DELETE", "", "/accounts/1", {}, {}, ""}).status == 405);
        }
    }
}

TEST_SUITE("Rest - Client support") {

    TEST_CASE("Path escaping") {
        CHECK(escape_path("abc-123_~.") == "abc-123_~.");
        CHECK(escape_path("a b") == "a%20b");
        CHECK(escape_path("x/y") == "x%2Fy");
        CHECK(escape_path("") == "");
    }

    TEST_CASE("Doer") {
        EchoDoer doer;
        Doer& d = doer;
        Request request;
        request.method = "GET";
        request.host = "cellar.local";
        request.path = "/accounts";

        CHECK(d.execute(request).body == "GET cellar.local/accounts");
        CHECK(doer.last.host == "cellar.local");
    }
}
