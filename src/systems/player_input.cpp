#include "player_input.hpp"
#include "../components.hpp"
#include "../control_decoder.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include "../math_util.hpp"
#include <raylib.h>
#include <vector>

using namespace ecs;

static RawControls reduce(const InputRecord& record) {
    RawControls c;

    // 1. Keyboard
    c.up    = record.keys_down[KEY_UP];
    c.down  = record.keys_down[KEY_DOWN];
    c.left  = record.keys_down[KEY_LEFT];
    c.right = record.keys_down[KEY_RIGHT];
    c.brake = record.keys_down[KEY_SPACE];
    c.boost = record.keys_down[KEY_A];

    // 2. Gamepads
    const float deadzone = 0.15f;
    for (const auto& gp : record.gamepads) {
        if (gp.id < 0 || gp.id >= RawControls::kMaxPads) continue;
        // Left Y is positive down in raylib; the arena is y-up.
        ecs::Vec2 stick = {gp.axes[GAMEPAD_AXIS_LEFT_X], -gp.axes[GAMEPAD_AXIS_LEFT_Y]};
        c.pad_connected[gp.id] = gp.connected;
        c.pad_south[gp.id]     = gp.buttons[GAMEPAD_BUTTON_RIGHT_FACE_DOWN];
        c.pad_stick[gp.id]     = puck::math::apply_deadzone(stick, deadzone);
    }
    return c;
}

void PlayerInputSystem::Update(World& world) {
    auto* input_ptr = world.try_resource<InputRecord>();
    auto* events    = world.try_resource<Events<InputEvent>>();
    if (!input_ptr || !events) return;

    const RawControls now = reduce(*input_ptr);

    std::vector<InputEvent> decoded;
    world.single<PlayerInput>([&](Entity, PlayerInput& input) {
        input.previous = input.current;
        input.current  = now;
        ControlDecoder::decode(input.previous, input.current, decoded);
    });

    for (const auto& ev : decoded) events->send(ev);
}
