#include "architecture.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/utsname.h>

#include <array>

namespace {
    constexpr std::array<std::string_view, 9> machines_64 = {
        "64", "x86_64", "amd64", "aarch64", "arm64", "ppc64le", "ppc64", "s390x", "riscv64"
    };
    constexpr std::array<std::string_view, 9> machines_32 = {
        "32", "i386", "i486", "i586", "i686", "x86", "armv6l", "armv7l", "arm"
    };
}

Bitness bitness_from_machine(std::string_view machine) {
    for (auto name : machines_64) {
        if (machine == name) return Bitness::Bits64;
    }
    for (auto name : machines_32) {
        if (machine == name) return Bitness::Bits32;
    }
    return Bitness::Unsupported;
}

Bitness detect_bitness(const std::string& override_machine) {
    std::string machine = override_machine;
    if (machine.empty()) {
        struct utsname buf;
        if (uname(&buf) != 0) {
            throw VciException(ErrorKind::UnsupportedEnvironment, get_string("error.get_arch_failed"));
        }
        machine = buf.machine;
    }

    Bitness bitness = bitness_from_machine(machine);
    if (bitness == Bitness::Unsupported) {
        throw VciException(ErrorKind::UnsupportedEnvironment, string_format("error.unsupported_arch", machine));
    }
    return bitness;
}

std::string_view architecture_tag(Bitness bitness) {
    switch (bitness) {
        case Bitness::Bits64: return "x86";
        case Bitness::Bits32: return "386";
        case Bitness::Unsupported: break;
    }
    throw VciException(ErrorKind::UnsupportedEnvironment, string_format("error.unsupported_arch", std::string("unknown")));
}

std::string artifact_filename(const std::string& version, Bitness bitness, std::string_view os) {
    std::string name(ARTIFACT_PREFIX);
    name += version;
    name += '_';
    name += os;
    name += '_';
    name += architecture_tag(bitness);
    name += ".zip";
    return name;
}
