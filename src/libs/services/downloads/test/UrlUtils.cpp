/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Podkeep.
 *
 * Podkeep is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Podkeep is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Podkeep.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include "UrlUtils.hpp"

namespace podkeep::downloads::tests
{
    TEST(UrlUtils, getPath)
    {
        struct TestCase
        {
            std::string_view url;
            std::string_view expectedPath;
        };

        constexpr TestCase tests[]{
            { "https://cdn.example.com/shows/ep1.mp3", "/shows/ep1.mp3" },
            { "https://cdn.example.com/shows/ep1.mp3?x=1&y=2", "/shows/ep1.mp3" },
            { "https://cdn.example.com/ep1.mp3#t=10", "/ep1.mp3" },
            { "https://cdn.example.com", "" },
            { "https://cdn.example.com?x=1", "" },
            { "/relative/path.m4a?x", "/relative/path.m4a" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(urlUtils::getPath(test.url), test.expectedPath) << "url = " << test.url;
    }

    TEST(UrlUtils, getFileExtension)
    {
        struct TestCase
        {
            std::string_view url;
            std::string_view mimeType;
            std::string_view expectedExtension;
        };

        constexpr TestCase tests[]{
            { "https://cdn.example.com/ep1.mp3", "", "mp3" },
            { "https://cdn.example.com/ep1.M4A?token=abc", "audio/mpeg", "m4a" },
            { "https://cdn.example.com/ep1.mp3/", "audio/mp4", "m4a" },
            { "https://cdn.example.com/download?id=12", "audio/ogg", "ogg" },
            { "https://cdn.example.com/download?id=12", "Audio/X-M4A; charset=binary", "m4a" },
            { "https://cdn.example.com/download", "application/octet-stream", "mp3" },
            { "https://cdn.example.com/file.verylongext", "audio/aac", "aac" },
            { "https://cdn.example.com/file.mp-3", "", "mp3" },
            { "https://cdn.example.com/v1.2/episode", "audio/wav", "wav" },
            { "", "", "mp3" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(urlUtils::getFileExtension(test.url, test.mimeType), test.expectedExtension) << "url = " << test.url << ", mimeType = " << test.mimeType;
    }

    TEST(UrlUtils, isSignedUrl)
    {
        EXPECT_TRUE(urlUtils::isSignedUrl("https://d1.cloudfront.net/ep.mp3?Expires=1700000000&Signature=abc&Key-Pair-Id=K1"));
        EXPECT_TRUE(urlUtils::isSignedUrl("https://cdn.example.com/ep.mp3?token=abc"));
        EXPECT_TRUE(urlUtils::isSignedUrl("https://cdn.example.com/ep.mp3?hmac=abc"));
        EXPECT_FALSE(urlUtils::isSignedUrl("https://cdn.example.com/ep.mp3"));
        EXPECT_FALSE(urlUtils::isSignedUrl("https://cdn.example.com/ep.mp3?id=12"));
    }

    TEST(UrlUtils, isTrackingUrl)
    {
        EXPECT_TRUE(urlUtils::isTrackingUrl("https://dts.podtrac.com/redirect.mp3/cdn.example.com/ep.mp3"));
        EXPECT_TRUE(urlUtils::isTrackingUrl("https://chtbl.com/track/1234/traffic.megaphone.fm/ABC.mp3"));
        EXPECT_TRUE(urlUtils::isTrackingUrl("https://WWW.PODTRAC.COM/ep.mp3"));
        EXPECT_FALSE(urlUtils::isTrackingUrl("https://cdn.example.com/ep.mp3"));

        EXPECT_TRUE(urlUtils::isProbeSensitiveUrl("https://mgln.ai/e/1/cdn.example.com/ep.mp3"));
        EXPECT_TRUE(urlUtils::isProbeSensitiveUrl("https://cdn.example.com/ep.mp3?Signature=1"));
        EXPECT_FALSE(urlUtils::isProbeSensitiveUrl("https://cdn.example.com/ep.mp3"));
    }

    TEST(UrlUtils, resolveLocation)
    {
        struct TestCase
        {
            std::string_view requestUrl;
            std::string_view location;
            std::string_view expectedUrl;
        };

        constexpr TestCase tests[]{
            { "https://a.example.com/x/y.mp3", "https://b.example.com/z.mp3", "https://b.example.com/z.mp3" },
            { "https://a.example.com/x/y.mp3", "//b.example.com/z.mp3", "https://b.example.com/z.mp3" },
            { "http://a.example.com/x/y.mp3", "//b.example.com/z.mp3", "http://b.example.com/z.mp3" },
            { "https://a.example.com:8443/x/y.mp3?q=1", "/z.mp3", "https://a.example.com:8443/z.mp3" },
            { "https://a.example.com/x/y.mp3", "z.mp3", "https://a.example.com/x/z.mp3" },
            { "https://a.example.com", "z.mp3", "https://a.example.com/z.mp3" },
            { "https://a.example.com/x/y.mp3", "  /z.mp3 ", "https://a.example.com/z.mp3" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(urlUtils::resolveLocation(test.requestUrl, test.location), test.expectedUrl) << "requestUrl = " << test.requestUrl << ", location = " << test.location;
    }
} // namespace podkeep::downloads::tests
