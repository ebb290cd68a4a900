#pragma once

constexpr int input_key_none = -1;
constexpr int input_key_tab = '\t';
constexpr int input_key_enter = '\n';
constexpr int input_key_escape = 0x1b;
constexpr int input_key_backspace = 0x7f;

constexpr int input_key_up = 1001;
constexpr int input_key_down = 1002;
constexpr int input_key_left = 1003;
constexpr int input_key_right = 1004;

// Non-canonical, no echo. Reads are gated by poll, so the descriptor stays blocking
// (stdout usually shares it).
void input_init();
void input_shutdown();

// Waits up to timeout_ms for one key. Returns input_key_none on timeout.
int input_poll_key(int timeout_ms);
