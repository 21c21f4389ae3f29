#ifndef GLMIRROR_UTILS_SYMBOL_HPP_INCLUDED
#define GLMIRROR_UTILS_SYMBOL_HPP_INCLUDED

#include "error.hpp"
#include <dlfcn.h>
#include <string>

#define TRY_ATTACH_SYMBOL(target, name, lib)                                   \
    ::gm::attach_symbol(target, name, lib)

namespace gm
{
/* The handle is never closed; function tables loaded from it live until
 * exit.
 */
inline auto open_module(std::string const& path) -> void*
{
    auto lib = dlopen(path.c_str(), RTLD_LAZY);
    if (!lib)
        throw ModuleError { "Couldn't load " + path + ": " + dlerror() };

    return lib;
}

template <typename F>
auto attach_symbol(F** fn, char const* name, void* lib) -> void
{
    *fn = reinterpret_cast<F*>(dlsym(lib, name));
    if (!*fn)
        throw ModuleError { std::string { "Couldn't load symbol: " } + name };
}
} // namespace gm

#endif // GLMIRROR_UTILS_SYMBOL_HPP_INCLUDED
