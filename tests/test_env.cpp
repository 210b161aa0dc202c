// Cross-platform environment setter for tests that toggle FEE_* flags.

#include "test_env.hpp"
#include <cstdlib>

#if defined(_WIN32)
static int set_env(const char* name, const char* value){ return _putenv_s(name, value ? value : ""); }
#else
static int set_env(const char* name, const char* value){
    if(!value) return ::unsetenv(name);
    return ::setenv(name, value, 1);
}
#endif

ScopedEnv::ScopedEnv(const char* name, const char* value) : name_(name) {
    if(const char* old = std::getenv(name)) previous_ = old;
    set_env(name, value);
}

ScopedEnv::~ScopedEnv(){
    set_env(name_.c_str(), previous_ ? previous_->c_str() : nullptr);
}
