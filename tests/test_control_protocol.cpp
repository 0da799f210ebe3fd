/*
 *  test_control_protocol.cpp - Control channel wire format and dispatch
 *
 *  Decodes every message type, checks that malformed frames are rejected
 *  without side effects, and runs frames through the dispatcher with the
 *  emulated adapter to verify role and permission gating.
 */

#include <stdio.h>

#include <string>
#include <vector>

#include "control/emulated_adapter.h"
#include "event/event_loop.h"
#include "protocol/control_dispatcher.h"
#include "protocol/control_message.h"

static int failures = 0;

static void check(bool ok, const char *what)
{
	printf("  %s: %s\n", ok ? "ok  " : "FAIL", what);
	if (!ok) failures++;
}

static void test_decode()
{
	printf("\n=== Decoding ===\n");
	using namespace protocol;

	auto move = decode_control_message("{\"type\":\"mousemove\",\"x\":0.25,\"y\":0.75}");
	check(move && std::holds_alternative<PointerMove>(*move), "mousemove decodes");
	if (move && std::holds_alternative<PointerMove>(*move)) {
		const auto &m = std::get<PointerMove>(*move);
		check(m.x == 0.25 && m.y == 0.75, "mousemove coordinates kept");
	}

	auto clamped = decode_control_message("{\"type\":\"mousemove\",\"x\":1.5,\"y\":-0.2}");
	check(clamped && std::get<PointerMove>(*clamped).x == 1.0 &&
	      std::get<PointerMove>(*clamped).y == 0.0, "out-of-range coordinates are clamped");

	auto down = decode_control_message("{\"type\":\"mousedown\",\"x\":0.5,\"y\":0.5,\"button\":2}");
	check(down && std::holds_alternative<PointerButton>(*down) &&
	      std::get<PointerButton>(*down).phase == Phase::Down &&
	      std::get<PointerButton>(*down).button == 2, "mousedown with right button");

	auto up = decode_control_message("{\"type\":\"mouseup\",\"x\":0.5,\"y\":0.5}");
	check(up && std::get<PointerButton>(*up).phase == Phase::Up &&
	      std::get<PointerButton>(*up).button == 0, "mouseup defaults to left button");

	auto scroll = decode_control_message("{\"type\":\"scroll\",\"deltaX\":0,\"deltaY\":-120}");
	check(scroll && std::get<Scroll>(*scroll).dy == -120.0, "scroll delta");

	auto key = decode_control_message(
		"{\"type\":\"keydown\",\"key\":\"a\",\"code\":\"KeyA\",\"ctrlKey\":true}");
	check(key && std::holds_alternative<Key>(*key), "keydown decodes");
	if (key && std::holds_alternative<Key>(*key)) {
		const auto &k = std::get<Key>(*key);
		check(k.code == "KeyA" && k.modifiers && k.modifiers->ctrl && !k.modifiers->shift,
		      "keydown modifiers present");
	}

	auto plain_key = decode_control_message("{\"type\":\"keyup\",\"key\":\"Enter\",\"code\":\"Enter\"}");
	check(plain_key && !std::get<Key>(*plain_key).modifiers, "keyup without modifiers has none");

	auto clip = decode_control_message("{\"type\":\"clipboard\",\"content\":\"hello\"}");
	check(clip && std::get<Clipboard>(*clip).content == "hello", "clipboard content");

	auto meta = decode_control_message(
		"{\"type\":\"file-meta\",\"id\":\"f1\",\"name\":\"a.txt\",\"size\":10,\"fromUserId\":\"u1\"}");
	check(meta && std::get<FileMeta>(*meta).mime == "application/octet-stream",
	      "file-meta without mime gets the default");

	auto cap = decode_control_message(
		"{\"type\":\"capability\",\"role\":\"host\",\"features\":[\"mouse\",\"keyboard\"]}");
	check(cap && std::get<Capability>(*cap).features.size() == 2, "capability features");
}

static void test_malformed()
{
	printf("\n=== Malformed frames ===\n");
	using namespace protocol;

	std::string error;
	check(!decode_control_message("not json", &error) && !error.empty(), "garbage is rejected with a reason");
	check(!decode_control_message("[1,2,3]"), "non-object is rejected");
	check(!decode_control_message("{\"x\":1}"), "missing type is rejected");
	check(!decode_control_message("{\"type\":\"teleport\"}"), "unknown type is rejected");
	check(!decode_control_message("{\"type\":\"mousemove\",\"x\":\"left\",\"y\":0}"),
	      "non-numeric coordinate is rejected");
	check(!decode_control_message("{\"type\":\"mousedown\",\"x\":0,\"y\":0,\"button\":9}"),
	      "invalid button is rejected");
	check(!decode_control_message("{\"type\":\"file-chunk\",\"id\":\"f\",\"index\":-1,\"dataB64\":\"\"}"),
	      "negative chunk index is rejected");
	check(!decode_control_message("{\"type\":\"keydown\",\"code\":\"KeyA\"}"), "key without 'key' is rejected");
}

static void test_encode()
{
	printf("\n=== Encoding ===\n");
	using namespace protocol;

	Key key;
	key.key = "z";
	key.code = "KeyZ";
	key.phase = Phase::Up;
	std::string frame = encode_control_message(key);
	check(frame.find("\"keyup\"") != std::string::npos, "key up encodes as keyup");
	check(frame.find("ctrlKey") == std::string::npos, "no modifier fields when none were given");

	auto back = decode_control_message(frame);
	check(back && std::get<Key>(*back).key == "z" && std::get<Key>(*back).phase == Phase::Up,
	      "encoded key decodes to the same event");

	check(std::string(message_type_name(FileComplete{"f", 3})) == "file-complete", "type name of file-complete");
	check(is_input_message(Scroll{}) && !is_input_message(Clipboard{}), "input classification");

	// Latin-1 text from a platform clipboard
	std::string latin1 = encode_control_message(Clipboard{"caf\xe9"});
	check(latin1.find("caf\xEF\xBF\xBD") != std::string::npos, "invalid UTF-8 replaced instead of throwing");
	auto decoded = decode_control_message(latin1);
	check(decoded && std::get<Clipboard>(*decoded).content == "caf\xEF\xBF\xBD", "replaced text decodes");
}

static void test_dispatch()
{
	printf("\n=== Dispatch ===\n");
	using namespace protocol;

	event::ManualLoop loop;
	std::vector<std::string> notices;
	auto notify = [&notices](notice::Level, const std::string &title, const std::string &) {
		notices.push_back(title);
	};

	control::EmulatedAdapter adapter(1001, 501);
	adapter.init();

	DispatcherSettings settings;
	ControlDispatcher host(Role::Host, loop, settings, notify);
	host.set_adapter(&adapter);

	auto outcome = host.dispatch("peer-1", "{\"type\":\"mousemove\",\"x\":0.5,\"y\":0.5}");
	check(outcome == ControlDispatcher::Outcome::Handled, "host handles pointer move");
	check(adapter.cursor_x() == 500 && adapter.cursor_y() == 250, "cursor moved to screen center");

	host.dispatch("peer-1", "{\"type\":\"mousedown\",\"x\":0.5,\"y\":0.5,\"button\":0}");
	check(adapter.button_mask() == 1, "left button held");
	host.dispatch("peer-1", "{\"type\":\"mouseup\",\"x\":0.5,\"y\":0.5,\"button\":0}");
	check(adapter.button_mask() == 0, "left button released");

	host.dispatch("peer-1", "{\"type\":\"keydown\",\"key\":\"a\",\"code\":\"KeyA\"}");
	check(adapter.pressed_keys().count("KeyA") == 1, "key held");

	uint64_t events = adapter.event_count();
	outcome = host.dispatch("peer-1", "{\"type\":\"mousemove\",\"x\":");
	check(outcome == ControlDispatcher::Outcome::Malformed, "truncated frame is malformed");
	check(adapter.event_count() == events, "malformed frame does not reach the adapter");

	host.set_control_enabled(false);
	outcome = host.dispatch("peer-1", "{\"type\":\"mousemove\",\"x\":0.0,\"y\":0.0}");
	check(outcome == ControlDispatcher::Outcome::Ignored, "input ignored while control is disabled");
	check(adapter.cursor_x() == 500, "cursor unchanged while control is disabled");
	host.set_control_enabled(true);

	outcome = host.dispatch("peer-1", "{\"type\":\"clipboard\",\"content\":\"copied\"}");
	check(outcome == ControlDispatcher::Outcome::Handled && adapter.clipboard() == "copied",
	      "clipboard written through the adapter");

	host.set_allow_clipboard(false);
	outcome = host.dispatch("peer-1", "{\"type\":\"clipboard\",\"content\":\"blocked\"}");
	check(outcome == ControlDispatcher::Outcome::Ignored && adapter.clipboard() == "copied",
	      "clipboard refused when sharing is disabled");
	check(!notices.empty() && notices.back() == "Clipboard disabled", "refusal raises a notice");

	// Controllers never act on input
	ControlDispatcher controller(Role::Controller, loop, settings, notify);
	controller.set_adapter(&adapter);
	outcome = controller.dispatch("host-1", "{\"type\":\"mousemove\",\"x\":0.0,\"y\":0.0}");
	check(outcome == ControlDispatcher::Outcome::Ignored, "controller ignores input");

	std::string received;
	controller.set_adapter(nullptr);
	controller.set_clipboard_sink([&received](const std::string &, const std::string &content) {
		received = content;
	});
	controller.dispatch("host-1", "{\"type\":\"clipboard\",\"content\":\"from host\"}");
	check(received == "from host", "controller clipboard goes to the sink");

	check(parse_role("host") == Role::Host && !parse_role("admin"), "role names");
}

int main()
{
	printf("=== test_control_protocol - control channel messages ===\n");

	test_decode();
	test_malformed();
	test_encode();
	test_dispatch();

	bool passed = failures == 0;
	if (passed) {
		printf("\n*** PASS: control protocol ***\n");
	} else {
		printf("\n*** FAIL: %d check(s) failed ***\n", failures);
	}
	return passed ? 0 : 1;
}
