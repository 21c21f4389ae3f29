#ifndef GLMIRROR_GL_OBJECT_HPP_INCLUDED
#define GLMIRROR_GL_OBJECT_HPP_INCLUDED

#include "utils/contracts.hpp"
#include <GL/gl.h>
#include <type_traits>
#include <utility>

namespace gm
{
namespace opengl
{

// clang-format off
template<typename T>
concept ObjectTraits =
        std::is_default_constructible_v<T> &&
        requires(T val, GLuint name) {

    typename T::category;
    { val.destroy(name) };
};

template<typename T>
concept BindableTraits =
        ObjectTraits<T> &&
        requires(T val, GLuint name, GLenum target_name) {

    { val.bind(target_name, name) };
    { val.unbind(target_name) };
};

template<typename T>
concept Object = requires (T val) {
    typename T::category;
    typename T::traits_type;

    requires ObjectTraits<typename T::traits_type>;
    { val.name() };
};
// clang-format on

/* Owns one GL object name and deletes it on destruction. Move-only; a
 * moved-from object holds `no_name`.
 */
template <ObjectTraits Traits>
struct ObjectBase
{
    static constexpr GLuint no_name = static_cast<GLuint>(0);

    using traits_type = Traits;
    using name_type = GLuint;
    using category = typename traits_type::category;

    ObjectBase() noexcept = default;
    explicit ObjectBase(GLuint name) noexcept
        : name_ { name }
    {
    }

    ObjectBase(ObjectBase&& other) noexcept
        : name_ { std::exchange(other.name_, no_name) }
    {
    }

    ObjectBase(ObjectBase const&) = delete;
    auto operator=(ObjectBase const&) -> ObjectBase& = delete;

    ~ObjectBase()
    {
        if (name_ == no_name)
            return;

        traits_.destroy(name_);
    }

    auto operator=(ObjectBase&& other) noexcept -> ObjectBase&
    {
        using std::swap;
        auto tmp { std::move(other) };
        swap(*this, tmp);
        return *this;
    }

    auto name() const noexcept -> name_type { return name_; }

    /* Gives up ownership without deleting the GL object.
     */
    [[nodiscard]] auto release() noexcept -> name_type
    {
        return std::exchange(name_, no_name);
    }

    template <ObjectTraits T_>
    friend auto swap(ObjectBase<T_>& lhs, ObjectBase<T_>& rhs) noexcept -> void;

    explicit operator bool() const noexcept { return name_ != no_name; }

private:
    name_type name_ { no_name };
    [[no_unique_address]] traits_type traits_ {};
};

template <ObjectTraits Traits>
auto swap(ObjectBase<Traits>& lhs, ObjectBase<Traits>& rhs) noexcept -> void
{
    using std::swap;
    swap(lhs.name_, rhs.name_);
}

template <Object T, typename... Args>
auto create(Args&&... args) -> T
{
    typename T::traits_type traits {};
    return T { traits.create(std::forward<Args>(args)...) };
}

/* Keeps `name` bound to `target` for the lifetime of the binding. Restores
 * the target to 0 on every exit path.
 */
template <BindableTraits Traits>
struct Binding
{
    using traits_type = Traits;
    using category = typename traits_type::category;

    Binding(GLenum target, GLuint name)
        : target_ { target }
        , name_ { name }
    {
        GM_EXPECT(name_ != 0);
        traits_.bind(target_, name_);
    }

    Binding(Binding const&) = delete;
    auto operator=(Binding const&) -> Binding& = delete;
    Binding(Binding&&) = delete;
    auto operator=(Binding&&) -> Binding& = delete;

    ~Binding() { traits_.unbind(target_); }

    auto target() const noexcept -> GLenum { return target_; }
    auto name() const noexcept -> GLuint { return name_; }

private:
    GLenum target_;
    GLuint name_;
    [[no_unique_address]] traits_type traits_ {};
};

template <Object O>
[[nodiscard]] auto bind(GLenum target, O const& obj)
    -> Binding<typename O::traits_type>
{
    return Binding<typename O::traits_type> { target, obj.name() };
}

template <Object O, typename F>
decltype(auto) bind(GLenum target, O const& obj, F f)
{
    Binding<typename O::traits_type> binding { target, obj.name() };
    return f(binding);
}

} // namespace opengl

} // namespace gm

#endif // GLMIRROR_GL_OBJECT_HPP_INCLUDED
