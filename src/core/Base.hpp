#pragma once

#include "core/Core.h"
#include "core/Log.h"

/**
 * @brief Propagates a non-successful Result to the caller after logging the failing expression.
 */
#define CM_RETURN_IF_FAILED( x )                                                                                                                     \
    {                                                                                                                                                \
        ::CardioMorph::Result r_ = ( x );                                                                                                            \
        if( r_ != ::CardioMorph::Result::SUCCESS )                                                                                                   \
        {                                                                                                                                            \
            CM_ERROR( "Check Failed: {0} ({1})", #x, ::CardioMorph::toString( r_ ) );                                                                \
            return r_;                                                                                                                               \
        }                                                                                                                                            \
    }
