#include "recordfetcher.hpp"
#include "zonefixture.hpp"
#include "gtest/gtest.h"
#include <boost/chrono.hpp>
#include <cstring>
#include <iostream>

class RecordFetcherTest : public ::testing::Test
{

public:
    dnssec::MockTransport mTransport;
    dnssec::RRSet         mDS;

    virtual void SetUp()
    {
        mTransport.addZone( "." );
        mTransport.addZone( "com" );
        mTransport.addZone( "example.com" );

        mDS = dnssec::RRSet( "example.com", dnssec::CLASS_IN, dnssec::TYPE_DS, 86400 );
        mDS.add( std::make_shared<dnssec::RecordDS>( 1, 13, 2, std::vector<uint8_t>( 32, 1 ) ) );
        auto rrsig = std::make_shared<dnssec::RecordRRSIG>(
            dnssec::TYPE_DS, 13, 2, 86400, 2000000000, 1000000000, 2, "com", std::vector<uint8_t>( 64, 0 ) );
        mTransport.setAnswer( mDS, { rrsig } );
    }

    virtual void TearDown()
    {
    }
};

TEST_F( RecordFetcherTest, Answer )
{
    dnssec::Deadline      deadline( 5000 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    dnssec::FetchResult result = fetcher.fetch( "example.com", dnssec::TYPE_DS );

    ASSERT_TRUE( result.isOK() ) << result.mError;
    EXPECT_EQ( 1, result.mRRSet.count() );
    EXPECT_EQ( 86400, result.mRRSet.getTTL() );
    EXPECT_EQ( 1, result.mRRSIGs.size() );
    EXPECT_EQ( 1, result.mAttempts );
}

TEST_F( RecordFetcherTest, NoData )
{
    dnssec::Deadline      deadline( 5000 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    dnssec::FetchResult result = fetcher.fetch( "www.example.com", dnssec::TYPE_DNSKEY );

    EXPECT_EQ( dnssec::FETCH_NODATA, result.mStatus );
    EXPECT_TRUE( result.isNotFound() );
    EXPECT_FALSE( result.isFailure() );
    ASSERT_TRUE( result.mSOAOwner );
    EXPECT_EQ( dnssec::Domainname( "example.com" ), *result.mSOAOwner );
}

TEST_F( RecordFetcherTest, NXDomain )
{
    mTransport.setMode( "nx.example.com", dnssec::TYPE_DNSKEY, dnssec::MockAnswer::NXDOMAIN_ANSWER );

    dnssec::Deadline      deadline( 5000 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    dnssec::FetchResult result = fetcher.fetch( "nx.example.com", dnssec::TYPE_DNSKEY );
    EXPECT_EQ( dnssec::FETCH_NXDOMAIN, result.mStatus );
    EXPECT_TRUE( result.isNotFound() );
}

TEST_F( RecordFetcherTest, ServFailIsNotRetried )
{
    mTransport.setMode( "example.com", dnssec::TYPE_DS, dnssec::MockAnswer::SERVFAIL_ANSWER );

    dnssec::Deadline      deadline( 5000 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    dnssec::FetchResult result = fetcher.fetch( "example.com", dnssec::TYPE_DS );
    EXPECT_EQ( dnssec::FETCH_SERVFAIL, result.mStatus );
    EXPECT_TRUE( result.isFailure() );
    EXPECT_EQ( 1, mTransport.getQueryCount( "example.com", dnssec::TYPE_DS ) );
}

TEST_F( RecordFetcherTest, TimeoutIsRetried )
{
    mTransport.getAnswer( "example.com", dnssec::TYPE_DS ).mMode     = dnssec::MockAnswer::TIMEOUT;
    mTransport.getAnswer( "example.com", dnssec::TYPE_DS ).mTimeouts = 2;

    dnssec::Deadline      deadline( 5000 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    dnssec::FetchResult result = fetcher.fetch( "example.com", dnssec::TYPE_DS );
    EXPECT_TRUE( result.isOK() ) << result.mError;
    EXPECT_EQ( 3, result.mAttempts );
    EXPECT_EQ( 1, result.mRRSet.count() );
}

TEST_F( RecordFetcherTest, RetriesExhausted )
{
    mTransport.setMode( "example.com", dnssec::TYPE_DS, dnssec::MockAnswer::TIMEOUT );

    dnssec::Deadline      deadline( 5000 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    dnssec::FetchResult result = fetcher.fetch( "example.com", dnssec::TYPE_DS );
    EXPECT_EQ( dnssec::FETCH_TIMEOUT, result.mStatus );
    EXPECT_EQ( 3, result.mAttempts );
    EXPECT_EQ( 3, mTransport.getQueryCount( "example.com", dnssec::TYPE_DS ) );
}

TEST_F( RecordFetcherTest, UnreachableIsNotRetried )
{
    mTransport.setMode( "example.com", dnssec::TYPE_DS, dnssec::MockAnswer::UNREACHABLE );

    dnssec::Deadline      deadline( 5000 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    dnssec::FetchResult result = fetcher.fetch( "example.com", dnssec::TYPE_DS );
    EXPECT_EQ( dnssec::FETCH_UNREACHABLE, result.mStatus );
    EXPECT_EQ( 1, result.mAttempts );
}

TEST_F( RecordFetcherTest, DeadlineExceeded )
{
    dnssec::Deadline      deadline( 0 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    dnssec::FetchResult result = fetcher.fetch( "example.com", dnssec::TYPE_DS );
    EXPECT_EQ( dnssec::FETCH_DEADLINE_EXCEEDED, result.mStatus );
    EXPECT_EQ( 0, result.mAttempts );
    EXPECT_EQ( 0, mTransport.getQueryCount() );
}

TEST_F( RecordFetcherTest, DeadlineStopsRetries )
{
    mTransport.setMode( "example.com", dnssec::TYPE_DS, dnssec::MockAnswer::TIMEOUT );
    mTransport.setDelay( 60 );

    dnssec::Deadline      deadline( 100 );
    dnssec::RecordFetcher fetcher( mTransport, 10, deadline );

    dnssec::FetchResult result = fetcher.fetch( "example.com", dnssec::TYPE_DS );
    EXPECT_EQ( dnssec::FETCH_DEADLINE_EXCEEDED, result.mStatus );
    EXPECT_GE( result.mAttempts, 1 );
    EXPECT_LT( result.mAttempts, 11 ) << "retries stop at the deadline";
}

TEST_F( RecordFetcherTest, TransportGetsRemainingBudget )
{
    dnssec::Deadline      deadline( 5000 );
    dnssec::RecordFetcher fetcher( mTransport, 2, deadline );

    fetcher.fetch( "example.com", dnssec::TYPE_DS );

    EXPECT_LE( mTransport.getLastTimeout(), 5000 );
    EXPECT_GT( mTransport.getLastTimeout(), 4000 );
}

TEST_F( RecordFetcherTest, SlowServerIsBoundedByDeadline )
{
    mTransport.setDelay( 2000 );

    dnssec::Deadline      deadline( 100 );
    dnssec::RecordFetcher fetcher( mTransport, 10, deadline );

    boost::chrono::steady_clock::time_point start  = boost::chrono::steady_clock::now();
    dnssec::FetchResult                     result = fetcher.fetch( "example.com", dnssec::TYPE_DS );
    boost::chrono::milliseconds             elapsed =
        boost::chrono::duration_cast<boost::chrono::milliseconds>( boost::chrono::steady_clock::now() - start );

    EXPECT_EQ( dnssec::FETCH_DEADLINE_EXCEEDED, result.mStatus );
    EXPECT_LT( elapsed.count(), 1000 ) << "a query never outlives the request deadline";
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
