#include <gtest/gtest.h>
#include "test_support.hpp"

#include "doctor.hpp"

#include <sstream>

#if !defined(__APPLE__)

class DoctorTest : public ::testing::Test {
protected:
    TempDir dir;
    ScopedEnv path_env{ "PATH", dir.path().c_str() };
    ScopedEnv wayland{ "WAYLAND_DISPLAY", nullptr };
    ScopedEnv display{ "DISPLAY", nullptr };
    ScopedEnv config{ "CLIPWIRE_CONFIG", nullptr };
    ScopedEnv xdg{ "XDG_CONFIG_HOME", dir.path().c_str() };

    void tool(const std::string& name) {
        dir.write(name, "#!/bin/sh\nexit 0\n", 0755);
    }
};

TEST_F(DoctorTest, HealthyWayland) {
    ScopedEnv wl("WAYLAND_DISPLAY", "wayland-0");
    tool("wl-copy");
    tool("wl-paste");
    tool("ssh");

    std::ostringstream os;
    EXPECT_TRUE(run_doctor(os));
    std::string text = os.str();
    EXPECT_NE(text.find("Backend:   wayland"), std::string::npos);
    EXPECT_NE(text.find("Status:    OK"), std::string::npos);
    EXPECT_NE(text.find("ssh:       found"), std::string::npos);
    EXPECT_NE(text.find(dir.file("clipwire/config.yaml") + " (not found)"), std::string::npos);
}

TEST_F(DoctorTest, MissingToolsAreReported) {
    ScopedEnv x("DISPLAY", ":0");

    std::ostringstream os;
    EXPECT_FALSE(run_doctor(os));
    std::string text = os.str();
    EXPECT_NE(text.find("Status:    WARNING"), std::string::npos);
    EXPECT_NE(text.find("Missing:"), std::string::npos);
    EXPECT_NE(text.find("Tip:"), std::string::npos);
    EXPECT_NE(text.find("ssh:       not found"), std::string::npos);
}

TEST_F(DoctorTest, NoBackend) {
    std::ostringstream os;
    EXPECT_FALSE(run_doctor(os));
    EXPECT_NE(os.str().find("Backend:   none"), std::string::npos);
}

#endif
