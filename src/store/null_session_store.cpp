#include "null_session_store.hpp"
#include "../plugin.hpp"

static sift::StoreRegistrar reg_none("none",
    [](const sift::Config&) {
        return std::make_unique<sift::NullSessionStore>();
    });
