#include "core/CaptchaService.hpp"
#include "core/Pow.hpp"
#include <gtest/gtest.h>
#include <fmt/format.h>

using namespace std::chrono_literals;

class CaptchaServiceTest : public ::testing::Test {
  protected:
    CategoryCatalog catalog = {
        {"cat_illusion", {"c1.png", "c2.png", "c3.png", "c4.png", "c5.png"}},
        {"dog_illusion", {"d1.png", "d2.png", "d3.png", "d4.png", "d5.png"}},
        {"traffic_light", {"t1.png", "t2.png", "t3.png"}},
    };

    static std::string resolve(const std::string& category, const std::string& image) {
        return fmt::format("/images/{}/{}", category, image);
    }

    static SCaptchaSettings settingsWithDifficulty(int difficulty) {
        return SCaptchaSettings{.powDifficulty = difficulty, .powTtl = 180s};
    }

    static std::string solve(const SPowBlock& pow) {
        for (size_t i = 0;; ++i) {
            const auto NONCE = std::to_string(i);
            if (NPow::leadingZeroDigits(NPow::digestFor(pow.challenge, NONCE)) >= (size_t)pow.difficulty)
                return NONCE;
        }
    }

    static std::set<std::string> correctIdsOf(CCaptchaService& service, const std::string& id) {
        return service.store().peek(id).value().correctIds;
    }

    static std::set<std::string> wrongIdsOf(CCaptchaService& service, const SIssuedCaptcha& captcha) {
        const auto            CORRECT = correctIdsOf(service, captcha.captcha_id);
        std::set<std::string> wrong;
        for (const auto& img : captcha.images) {
            if (wrong.size() < CORRECT.size() && !CORRECT.contains(img.id))
                wrong.insert(img.id);
        }
        return wrong;
    }
};

TEST_F(CaptchaServiceTest, IssueShapesResponse) {
    CCaptchaService service(settingsWithDifficulty(3));
    const auto      CAPTCHA = service.issue(catalog, resolve);

    ASSERT_TRUE(CAPTCHA.has_value());
    EXPECT_EQ(CAPTCHA->captcha_id.size(), 32);
    EXPECT_TRUE(CAPTCHA->prompt == "Which images contain cat?" || CAPTCHA->prompt == "Which images contain dog?" ||
                CAPTCHA->prompt == "Which images contain traffic light?")
        << CAPTCHA->prompt;
    EXPECT_EQ(CAPTCHA->images.size(), 6);
    EXPECT_GE(CAPTCHA->select_count, 2);
    EXPECT_LE(CAPTCHA->select_count, 4);
    EXPECT_EQ(CAPTCHA->pow.difficulty, 3);
    EXPECT_EQ(CAPTCHA->pow.algo, "sha256-prefix-zeros");
    EXPECT_EQ(CAPTCHA->pow.challenge.size(), 32);

    std::set<std::string> gridIds;
    for (const auto& img : CAPTCHA->images) {
        EXPECT_TRUE(img.url.starts_with("/images/"));
        // ids are opaque, never the filename
        EXPECT_EQ(img.url.find(img.id), std::string::npos);
        gridIds.insert(img.id);
    }

    const auto CORRECT = correctIdsOf(service, CAPTCHA->captcha_id);
    EXPECT_EQ(CORRECT.size(), CAPTCHA->select_count);
    for (const auto& c : CORRECT) {
        EXPECT_TRUE(gridIds.contains(c));
    }

    EXPECT_EQ(service.pending(), 1);
}

TEST_F(CaptchaServiceTest, CorrectAnswerWithRealPow) {
    CCaptchaService service(settingsWithDifficulty(2));
    const auto      CAPTCHA = service.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    const auto RESULT = service.verify(CAPTCHA->captcha_id, correctIdsOf(service, CAPTCHA->captcha_id), solve(CAPTCHA->pow));

    EXPECT_TRUE(RESULT.success);
    EXPECT_EQ(RESULT.error, CAPTCHA_ERR_NONE);
    EXPECT_EQ(service.pending(), 0);
}

TEST_F(CaptchaServiceTest, SecondVerifyIsUnknown) {
    CCaptchaService service(settingsWithDifficulty(0));
    const auto      CAPTCHA = service.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    const auto CORRECT = correctIdsOf(service, CAPTCHA->captcha_id);

    EXPECT_TRUE(service.verify(CAPTCHA->captcha_id, CORRECT, "1").success);

    const auto AGAIN = service.verify(CAPTCHA->captcha_id, CORRECT, "1");
    EXPECT_FALSE(AGAIN.success);
    EXPECT_EQ(AGAIN.error, CAPTCHA_ERR_UNKNOWN_CHALLENGE);
}

TEST_F(CaptchaServiceTest, WrongAnswerConsumesPuzzle) {
    CCaptchaService service(settingsWithDifficulty(0));
    const auto      CAPTCHA = service.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    const auto WRONG = wrongIdsOf(service, CAPTCHA.value());
    ASSERT_EQ(WRONG.size(), CAPTCHA->select_count);

    const auto RESULT = service.verify(CAPTCHA->captcha_id, WRONG, "1");
    EXPECT_FALSE(RESULT.success);
    EXPECT_EQ(RESULT.error, CAPTCHA_ERR_NONE);

    EXPECT_EQ(service.verify(CAPTCHA->captcha_id, WRONG, "1").error, CAPTCHA_ERR_UNKNOWN_CHALLENGE);
}

TEST_F(CaptchaServiceTest, CountMismatchCheckedBeforePow) {
    // difficulty 64 can't be met, so reaching the pow check would fail differently
    CCaptchaService service(settingsWithDifficulty(64));
    const auto      CAPTCHA = service.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    auto selected = correctIdsOf(service, CAPTCHA->captcha_id);
    selected.insert("extra");

    const auto RESULT = service.verify(CAPTCHA->captcha_id, selected, "");
    EXPECT_FALSE(RESULT.success);
    EXPECT_EQ(RESULT.error, CAPTCHA_ERR_SELECTION_COUNT);
    EXPECT_EQ(RESULT.expectedCount, CAPTCHA->select_count);
    EXPECT_EQ(RESULT.submittedCount, CAPTCHA->select_count + 1);

    EXPECT_EQ(service.verify(CAPTCHA->captcha_id, selected, "1").error, CAPTCHA_ERR_UNKNOWN_CHALLENGE);
}

TEST_F(CaptchaServiceTest, MissingNonce) {
    CCaptchaService service(settingsWithDifficulty(0));
    const auto      CAPTCHA = service.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    const auto RESULT = service.verify(CAPTCHA->captcha_id, correctIdsOf(service, CAPTCHA->captcha_id), "");
    EXPECT_FALSE(RESULT.success);
    EXPECT_EQ(RESULT.error, CAPTCHA_ERR_MISSING_NONCE);
}

TEST_F(CaptchaServiceTest, FailedPowConsumesPuzzle) {
    CCaptchaService service(settingsWithDifficulty(64));
    const auto      CAPTCHA = service.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    const auto CORRECT = correctIdsOf(service, CAPTCHA->captcha_id);

    const auto RESULT = service.verify(CAPTCHA->captcha_id, CORRECT, "12345");
    EXPECT_FALSE(RESULT.success);
    EXPECT_EQ(RESULT.error, CAPTCHA_ERR_POW_DIFFICULTY);

    EXPECT_EQ(service.verify(CAPTCHA->captcha_id, CORRECT, "12345").error, CAPTCHA_ERR_UNKNOWN_CHALLENGE);
}

TEST_F(CaptchaServiceTest, ExpiredPow) {
    CCaptchaService service(settingsWithDifficulty(0));
    const auto      CAPTCHA = service.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    const auto RESULT = service.verify(CAPTCHA->captcha_id, correctIdsOf(service, CAPTCHA->captcha_id), "1", std::chrono::system_clock::now() + 1h);
    EXPECT_FALSE(RESULT.success);
    EXPECT_EQ(RESULT.error, CAPTCHA_ERR_POW_EXPIRED);
}

TEST_F(CaptchaServiceTest, UnknownId) {
    CCaptchaService service(settingsWithDifficulty(0));

    const auto      RESULT = service.verify("not-a-captcha", {"a", "b"}, "1");
    EXPECT_FALSE(RESULT.success);
    EXPECT_EQ(RESULT.error, CAPTCHA_ERR_UNKNOWN_CHALLENGE);
}

TEST_F(CaptchaServiceTest, NoCategories) {
    CCaptchaService service(settingsWithDifficulty(0));

    const auto      CAPTCHA = service.issue(CategoryCatalog{}, resolve);
    ASSERT_FALSE(CAPTCHA.has_value());
    EXPECT_EQ(CAPTCHA.error(), CAPTCHA_ERR_NO_CATEGORIES);
    EXPECT_EQ(service.pending(), 0);
}

TEST_F(CaptchaServiceTest, CheckIsNonDestructive) {
    CCaptchaService service(settingsWithDifficulty(4));
    const auto      CAPTCHA = service.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    const auto STATUS = service.check(CAPTCHA->captcha_id);
    ASSERT_TRUE(STATUS.has_value());
    EXPECT_EQ(STATUS->selectCount, CAPTCHA->select_count);
    EXPECT_EQ(STATUS->pow.challenge, CAPTCHA->pow.challenge);
    EXPECT_EQ(STATUS->pow.difficulty, 4);

    EXPECT_TRUE(service.check(CAPTCHA->captcha_id).has_value());
    EXPECT_EQ(service.pending(), 1);
    EXPECT_FALSE(service.check("missing").has_value());
}

TEST_F(CaptchaServiceTest, InstancesAreIndependent) {
    CCaptchaService first(settingsWithDifficulty(0));
    CCaptchaService second(settingsWithDifficulty(0));

    const auto      CAPTCHA = first.issue(catalog, resolve);
    ASSERT_TRUE(CAPTCHA.has_value());

    EXPECT_EQ(second.verify(CAPTCHA->captcha_id, correctIdsOf(first, CAPTCHA->captcha_id), "1").error, CAPTCHA_ERR_UNKNOWN_CHALLENGE);
    EXPECT_EQ(first.pending(), 1);
}

TEST_F(CaptchaServiceTest, ReapDropsExpiredPuzzles) {
    CCaptchaService service(settingsWithDifficulty(0));
    ASSERT_TRUE(service.issue(catalog, resolve).has_value());
    ASSERT_TRUE(service.issue(catalog, resolve).has_value());

    EXPECT_EQ(service.reapExpired(std::chrono::system_clock::now()), 0);
    EXPECT_EQ(service.reapExpired(std::chrono::system_clock::now() + 181s), 2);
    EXPECT_EQ(service.pending(), 0);
}

TEST_F(CaptchaServiceTest, CatsAndDogsEndToEnd) {
    const CategoryCatalog SMALL = {{"cats", {"a", "b", "c"}}, {"dogs", {"d", "e", "f", "g"}}};
    CCaptchaService       service(settingsWithDifficulty(0));

    for (int i = 0; i < 50; ++i) {
        const auto CAPTCHA = service.issue(SMALL, resolve);
        ASSERT_TRUE(CAPTCHA.has_value());
        EXPECT_EQ(CAPTCHA->images.size(), 6);

        const auto RESULT = service.verify(CAPTCHA->captcha_id, correctIdsOf(service, CAPTCHA->captcha_id), "any");
        EXPECT_TRUE(RESULT.success);
    }

    EXPECT_EQ(service.pending(), 0);
}
