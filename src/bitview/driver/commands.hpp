#pragma once

#include <argparse/argparse.hpp>

namespace bitview::driver {

auto LayoutCommand(const argparse::ArgumentParser& cmd) -> int;
auto DecodeCommand(const argparse::ArgumentParser& cmd) -> int;
auto SetCommand(const argparse::ArgumentParser& cmd) -> int;
auto StateCommand(const argparse::ArgumentParser& cmd) -> int;
auto RestoreCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace bitview::driver
