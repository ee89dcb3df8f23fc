#ifndef DNSSEC_ANALYTICSSINK_HPP
#define DNSSEC_ANALYTICSSINK_HPP

#include "result.hpp"
#include <string>

namespace dnssec
{
    /*!
     * receives one record per finished validation.
     * exceptions thrown by record() are logged and ignored by the caller.
     */
    class AnalyticsSink
    {
    public:
        virtual ~AnalyticsSink()
        {
        }

        virtual void record( const std::string &domain, Status status, const std::string &source ) = 0;
    };
}

#endif
