#include "threadpool.hpp"

namespace dnssec
{
    ThreadPool::~ThreadPool()
    {
        stop();
        join();
    }

    void ThreadPool::submit( Request req )
    {
        boost::unique_lock<boost::mutex> lock( mMutex );
        mRequests.push_back( req );
        mCondition.notify_one();
    }

    bool ThreadPool::pop( Request &req )
    {
        boost::unique_lock<boost::mutex> lock( mMutex );
        while ( mRequests.empty() ) {
            if ( !mIsContinue )
                return false;
            mCondition.wait( lock );
        }

        req = mRequests.front();
        mRequests.pop_front();
        return true;
    }

    void ThreadPool::work()
    {
        Request req;
        while ( pop( req ) )
            req();
    }

    void ThreadPool::start()
    {
        for ( unsigned int i = 0; i < mThreadCount; i++ )
            mThreads.push_back( std::make_shared<boost::thread>( &ThreadPool::work, this ) );
    }

    void ThreadPool::join()
    {
        for ( auto th : mThreads ) {
            if ( th->joinable() )
                th->join();
        }
        mThreads.clear();
    }

    void ThreadPool::stop()
    {
        boost::unique_lock<boost::mutex> lock( mMutex );
        mIsContinue = false;
        mCondition.notify_all();
    }
}
