#ifndef DNSSEC_THREADPOOL_HPP
#define DNSSEC_THREADPOOL_HPP

#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread.hpp>
#include <deque>
#include <memory>
#include <vector>

namespace dnssec
{
    typedef boost::function<void()> Request;

    /*!
     * fixed size worker pool.
     * After stop(), workers finish the queued requests and exit.
     */
    class ThreadPool : private boost::noncopyable
    {
    public:
        ThreadPool( unsigned int thread_count ) : mIsContinue( true ), mThreadCount( thread_count )
        {
        }

        ~ThreadPool();

        void submit( Request req );
        void start();
        void join();
        void stop();

        unsigned int getThreadCount() const
        {
            return mThreadCount;
        }

    private:
        bool                mIsContinue;
        unsigned int        mThreadCount;
        std::deque<Request> mRequests;

        std::vector<std::shared_ptr<boost::thread>> mThreads;
        boost::mutex                                mMutex;
        boost::condition_variable                   mCondition;

        void work();
        bool pop( Request &req );
    };
}

#endif
