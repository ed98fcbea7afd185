#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#if defined( _WIN32 ) && defined( CM_SHARED )
#    ifdef CM_BUILD_LIBRARY
#        define CM_API __declspec( dllexport )
#    else
#        define CM_API __declspec( dllimport )
#    endif
#else
#    define CM_API
#endif

namespace CardioMorph
{
    constexpr const char* VERSION_STRING = "1.0.0";

    using bool_t    = bool;
    using float32_t = float;
    using float64_t = double;

    // Error codes
    enum class Result : int32_t
    {
        SUCCESS       = 0,
        FAIL          = -1,
        INVALID_ARGS  = -3,
        OUT_OF_MEMORY = -10
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::OUT_OF_MEMORY:
                return "OUT_OF_MEMORY";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T>
    using HeapArray = std::vector<T>;

    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;

    template<typename T, typename... Args>
    constexpr Ref<T> CreateRef( Args&&... args )
    {
        return std::make_shared<T>( std::forward<Args>( args )... );
    }
} // namespace CardioMorph
