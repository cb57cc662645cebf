#pragma once

#include <string>
#include <string_view>

enum class Bitness {
    Bits32,
    Bits64,
    Unsupported
};

// Maps a uname(2) machine name, or the literal "32"/"64", to a bitness.
Bitness bitness_from_machine(std::string_view machine);

// Uses the override when non-empty, otherwise asks uname(2).
// Throws VciException(UnsupportedEnvironment) when neither 32 nor 64 bit.
Bitness detect_bitness(const std::string& override_machine = "");

// "x86" for 64-bit hosts, "386" for 32-bit hosts.
std::string_view architecture_tag(Bitness bitness);

// veracode-cli_<version>_<os>_<tag>.zip
std::string artifact_filename(const std::string& version, Bitness bitness, std::string_view os = "windows");
