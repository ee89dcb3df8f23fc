#include "bulkvalidator.hpp"
#include "threadpool.hpp"
#include "zonefixture.hpp"
#include "gtest/gtest.h"
#include <atomic>
#include <cstring>
#include <iostream>

const uint32_t NOW = 1700000000;

class ThreadPoolTest : public ::testing::Test
{
public:
    virtual void SetUp()
    {
    }

    virtual void TearDown()
    {
    }
};

TEST_F( ThreadPoolTest, RunsAllRequests )
{
    std::atomic<unsigned int> count( 0 );
    {
        dnssec::ThreadPool pool( 3 );
        for ( int i = 0; i < 20; i++ )
            pool.submit( [&count]() { count++; } );
        pool.start();
        pool.stop();
        pool.join();
    }
    EXPECT_EQ( 20, count.load() );
}

TEST_F( ThreadPoolTest, DestructorJoinsWorkers )
{
    std::atomic<unsigned int> count( 0 );
    {
        dnssec::ThreadPool pool( 2 );
        pool.start();
        for ( int i = 0; i < 5; i++ )
            pool.submit( [&count]() { count++; } );
    }
    EXPECT_EQ( 5, count.load() );
}

class BulkValidatorTest : public ::testing::Test
{

public:
    std::unique_ptr<dnssec::SignedHierarchy> mHierarchy;
    dnssec::MockCertificateSource            mSource;
    dnssec::Config                           mConfig;
    std::unique_ptr<dnssec::FixedClock>      mClock;
    std::unique_ptr<dnssec::Validator>       mValidator;

    virtual void SetUp()
    {
        mHierarchy.reset( new dnssec::SignedHierarchy( NOW ) );
        mHierarchy->addSignedZone( "." );
        mHierarchy->addSignedZone( "dk" );
        mHierarchy->addSignedZone( "bondit.dk" );
        mHierarchy->addUnsignedZone( "insecure.dk" );

        dnssec::MockAnswer &answer = mHierarchy->getTransport().getAnswer( "bondit.dk", dnssec::TYPE_DNSKEY );
        answer.mRRSIGs[ 0 ]        = dnssec::corruptRRSIG( *answer.mRRSIGs[ 0 ] );

        mConfig.mTrustAnchors      = mHierarchy->getTrustAnchors();
        mConfig.mDeadlineMSec      = 5000;
        mConfig.mBulk.mThreads     = 4;
        mConfig.mBulk.mMaxDomains  = 10;
        mClock.reset( new dnssec::FixedClock( NOW ) );
        mValidator.reset( new dnssec::Validator( mHierarchy->getTransport(), mSource, mConfig, *mClock ) );
    }

    virtual void TearDown()
    {
    }

    dnssec::BulkResult validate( const std::vector<std::string> &domains )
    {
        dnssec::BulkValidator bulk( *mValidator, mConfig.mBulk );
        return bulk.validate( domains, dnssec::ValidateOptions() );
    }
};

TEST_F( BulkValidatorTest, ResultsInRequestOrder )
{
    std::vector<std::string> domains;
    domains.push_back( "dk" );
    domains.push_back( "www.insecure.dk" );
    domains.push_back( "bondit.dk" );
    domains.push_back( "bad..dk" );
    domains.push_back( "insecure.dk" );
    domains.push_back( "dk" );

    dnssec::BulkResult bulk = validate( domains );

    ASSERT_EQ( domains.size(), bulk.mResults.size() );
    for ( unsigned int i = 0; i < domains.size(); i++ )
        EXPECT_EQ( domains[ i ], bulk.mResults[ i ].mDomain );

    EXPECT_EQ( dnssec::STATUS_VALID, bulk.mResults[ 0 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_INSECURE, bulk.mResults[ 1 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_BOGUS, bulk.mResults[ 2 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_ERROR, bulk.mResults[ 3 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_INSECURE, bulk.mResults[ 4 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_VALID, bulk.mResults[ 5 ].mStatus );
}

TEST_F( BulkValidatorTest, Summary )
{
    std::vector<std::string> domains;
    domains.push_back( "dk" );
    domains.push_back( "www.insecure.dk" );
    domains.push_back( "bondit.dk" );
    domains.push_back( "bad..dk" );
    domains.push_back( "insecure.dk" );

    dnssec::BulkResult bulk = validate( domains );

    EXPECT_EQ( 5, bulk.mSummary.mTotal );
    EXPECT_EQ( 1, bulk.mSummary.mValid );
    EXPECT_EQ( 2, bulk.mSummary.mInsecure );
    EXPECT_EQ( 1, bulk.mSummary.mBogus );
    EXPECT_EQ( 0, bulk.mSummary.mIndeterminate );
    EXPECT_EQ( 1, bulk.mSummary.mError );
    EXPECT_GE( bulk.mSummary.mProcessingTime, 0.0 );
}

TEST_F( BulkValidatorTest, SameResultAsSingleValidation )
{
    std::vector<std::string> domains( 10, "www.insecure.dk" );
    domains[ 3 ] = "dk";

    dnssec::BulkResult bulk = validate( domains );

    ASSERT_EQ( 10, bulk.mResults.size() );
    EXPECT_TRUE( mValidator->validate( "www.insecure.dk" ) == bulk.mResults[ 0 ] );
    EXPECT_TRUE( mValidator->validate( "dk" ) == bulk.mResults[ 3 ] );
    EXPECT_TRUE( bulk.mResults[ 0 ] == bulk.mResults[ 9 ] );
}

TEST_F( BulkValidatorTest, SingleThread )
{
    mConfig.mBulk.mThreads = 1;
    std::vector<std::string> domains;
    domains.push_back( "bondit.dk" );
    domains.push_back( "dk" );

    dnssec::BulkResult bulk = validate( domains );

    ASSERT_EQ( 2, bulk.mResults.size() );
    EXPECT_EQ( dnssec::STATUS_BOGUS, bulk.mResults[ 0 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_VALID, bulk.mResults[ 1 ].mStatus );
}

TEST_F( BulkValidatorTest, EmptyRequest )
{
    EXPECT_THROW( validate( std::vector<std::string>() ), dnssec::BulkRequestError );
}

TEST_F( BulkValidatorTest, TooManyDomains )
{
    std::vector<std::string> domains( 11, "dk" );
    EXPECT_THROW( validate( domains ), dnssec::BulkRequestError );

    domains.pop_back();
    EXPECT_EQ( 10, validate( domains ).mSummary.mTotal );
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
