#include "vstream/server/request.hpp"
#include "vstream/server/response.hpp"
#include "vstream/server/router.hpp"
#include <catch2/catch.hpp>
#include <string>

using namespace vstream;
using vstream::server::request;
using vstream::server::response;

namespace {

struct routed
{
    std::string route;
    std::string value;
};

class router_fixture
{
public:
    router_fixture()
    {
        r.set_segment_handler("/stream", "filename", record("stream", "filename"));
        r.set_segment_handler("/stream/hd/", "name", record("hd", "name"));
        r.set_static_mount_point("/media", missing_root);
        r.set_static_mount_point("/", missing_root);
    }

    response dispatch(http::verb method, std::string_view target)
    {
        request req(http::request<http::string_body>(method, target, 11));
        response resp(11, true);
        if (r.pre_routing(req, resp))
            r.proc_routing(req, resp);
        return resp;
    }

    server::router r;
    routed last;

private:
    server::router::handler_type record(std::string name, std::string param)
    {
        return [this, name, param](request& req, response& resp) {
            last = {name, std::string(req.path_param(param))};
            resp.set_empty_content(http::status::ok);
        };
    }

    // mounts answer 404 for everything below it
    const fs::path missing_root = "/nonexistent-vstream-root";
};

} // namespace

TEST_CASE_METHOD(router_fixture, "a single segment goes to the segment route", "[router]")
{
    auto resp = dispatch(http::verb::get, "/stream/clip.mp4");
    REQUIRE(resp.result() == http::status::ok);
    REQUIRE(last.route == "stream");
    REQUIRE(last.value == "clip.mp4");
}

TEST_CASE_METHOD(router_fixture, "the path is decoded before matching", "[router]")
{
    dispatch(http::verb::get, "/stream/my%20clip.mp4?t=10");
    REQUIRE(last.value == "my clip.mp4");
}

TEST_CASE_METHOD(router_fixture, "deeper paths fall through to the mounts", "[router]")
{
    SECTION("encoded slash")
    {
        auto resp = dispatch(http::verb::get, "/stream/a%2Fb.mp4");
        REQUIRE(last.route.empty());
        REQUIRE(resp.result() == http::status::not_found);
    }
    SECTION("mount below another route")
    {
        auto resp = dispatch(http::verb::head, "/media/videos/clip.mp4");
        REQUIRE(last.route.empty());
        REQUIRE(resp.result() == http::status::not_found);
    }
}

TEST_CASE_METHOD(router_fixture, "the longest matching prefix wins", "[router]")
{
    dispatch(http::verb::get, "/stream/hd/clip.mp4");
    REQUIRE(last.route == "hd");
    REQUIRE(last.value == "clip.mp4");

    dispatch(http::verb::get, "/stream/hd");
    REQUIRE(last.route == "stream");
    REQUIRE(last.value == "hd");
}

TEST_CASE_METHOD(router_fixture, "only GET and HEAD are routed", "[router]")
{
    auto resp = dispatch(http::verb::delete_, "/stream/clip.mp4");
    REQUIRE(resp.result() == http::status::method_not_allowed);
    REQUIRE(resp[http::field::allow] == "GET,HEAD");
    REQUIRE_FALSE(resp.keep_alive());
    REQUIRE(last.route.empty());
}

TEST_CASE("no matching route is a 404", "[router]")
{
    server::router r;
    r.set_segment_handler("/stream", "filename", [](request&, response& resp) {
        resp.set_empty_content(http::status::ok);
    });

    request get(http::request<http::string_body>(http::verb::get, "/other/clip.mp4", 11));
    response resp(11, true);
    REQUIRE(r.pre_routing(get, resp));
    r.proc_routing(get, resp);
    REQUIRE(resp.result() == http::status::not_found);

    request put(http::request<http::string_body>(http::verb::put, "/other/clip.mp4", 11));
    response put_resp(11, true);
    REQUIRE_FALSE(r.pre_routing(put, put_resp));
    REQUIRE(put_resp.result() == http::status::not_found);
}
