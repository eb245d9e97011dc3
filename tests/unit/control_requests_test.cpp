// Copyright (c) 2025 VAM Voice Relay
#include <cassert>
#include <iostream>
#include "app/control_requests.hpp"

static void test_client_id_resolution() {
    assert(app::resolve_client_id("c1", "h1") == "c1");
    assert(app::resolve_client_id("", "h1") == "h1");
    assert(app::resolve_client_id("  ", " h1 ") == "h1");
    assert(app::resolve_client_id("", "").empty());
}

static void test_speak_requires_client_and_text() {
    auto ok = app::check_speak_request("c1", "hola");
    assert(ok.ok && ok.http_status == 200 && ok.error.empty());

    auto no_client = app::check_speak_request("", "hola");
    assert(!no_client.ok && no_client.http_status == 400);
    assert(no_client.error.find("clientId") != std::string::npos);

    auto no_text = app::check_speak_request("c1", "   \n");
    assert(!no_text.ok && no_text.http_status == 400);
    assert(no_text.error == "Missing text");
}

static void test_stop_requires_client() {
    assert(app::check_stop_request("c1").ok);
    auto bad = app::check_stop_request("");
    assert(!bad.ok && bad.http_status == 400);
}

static void test_chat_requires_prompt() {
    assert(app::check_chat_request("hola").ok);
    auto bad = app::check_chat_request("\t");
    assert(!bad.ok && bad.http_status == 400 && bad.error == "Missing prompt");
}

int main() {
    test_client_id_resolution();
    test_speak_requires_client_and_text();
    test_stop_requires_client();
    test_chat_requires_prompt();
    std::cout << "control_requests_test: PASS\n";
    return 0;
}
