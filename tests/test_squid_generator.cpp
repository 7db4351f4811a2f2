#include <gtest/gtest.h>
#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

#include "generator/squid_generator.hpp"
#include "testing_utils.hpp"

namespace {
// Разбор идентификатора на машину, временную метку и счетчик (по двум последним дефисам)
struct ParsedId {
    std::string machineId;
    std::string timestamp;
    std::string counter;
};

ParsedId parseId(const std::string &id)
{
    const auto counterSep = id.rfind('-');
    const auto timestampSep = id.rfind('-', counterSep - 1);
    return { id.substr(0, timestampSep),
             id.substr(timestampSep + 1, counterSep - timestampSep - 1),
             id.substr(counterSep + 1) };
}
} // namespace

namespace squid::tests {

class SquidGeneratorTest : public ::testing::Test {
protected:
    /**
     * @brief Генератор с фиксированным идентификатором машины и заданными показаниями часов
     * @param machineId Идентификатор машины
     * @param millis Последовательность показаний часов
     */
    std::unique_ptr<SquidGenerator> makeGenerator(const std::string &machineId,
                                                  std::deque<int64_t> millis)
    {
        clock = std::make_shared<ScriptedClock>(std::move(millis));
        return std::make_unique<SquidGenerator>(machineId, provider, clock);
    }

    FixedMachineIdProvider provider { std::string("provider-machine") };
    std::shared_ptr<ScriptedClock> clock;
};

// Сценарий: две генерации в одну миллисекунду и одна в следующую
TEST_F(SquidGeneratorTest, SquidTestSameAndNextMillisecond)
{
    auto generator = makeGenerator("AAAA", { 1000, 1000, 1001 });

    EXPECT_EQ("AAAA-1000-0000", generator->generate());
    EXPECT_EQ("AAAA-1000-0001", generator->generate());
    EXPECT_EQ("AAAA-1001-0000", generator->generate());
}

// Счетчик дополняется нулями минимум до 4 цифр, но не обрезается
TEST_F(SquidGeneratorTest, SquidTestCounterWidensPastFourDigits)
{
    auto generator = makeGenerator("X", { 5 });

    std::vector<std::string> ids;
    for (size_t i = 0; i < 10001; i++) {
        ids.push_back(generator->generate());
    }

    EXPECT_EQ("X-5-0000", ids[0]);
    EXPECT_EQ("X-5-0009", ids[9]);
    EXPECT_EQ("X-5-9999", ids[9999]);
    EXPECT_EQ("X-5-10000", ids[10000]);
    EXPECT_EQ("10000", parseId(ids[10000]).counter);
    EXPECT_EQ(10000U, generator->counter());
}

// Внутри одной миллисекунды счетчик растет ровно на единицу
TEST_F(SquidGeneratorTest, SquidTestCounterIncrementsWithinMillisecond)
{
    auto generator = makeGenerator("node", { 42, 42, 42, 42 });

    for (uint64_t expected = 0; expected < 4; expected++) {
        generator->generate();
        EXPECT_EQ(expected, generator->counter());
        EXPECT_EQ(42U, generator->lastTimestamp());
    }
}

// При смене временной метки счетчик сбрасывается
TEST_F(SquidGeneratorTest, SquidTestCounterResetsOnTimestampChange)
{
    auto generator = makeGenerator("node", { 7, 7, 7, 9, 9, 12 });

    const std::vector<std::string> expected = { "node-7-0000", "node-7-0001", "node-7-0002",
                                                "node-9-0000", "node-9-0001", "node-12-0000" };
    for (const auto &id : expected) {
        EXPECT_EQ(id, generator->generate());
    }
    EXPECT_EQ(12U, generator->lastTimestamp());
    EXPECT_EQ(0U, generator->counter());
}

// Начальное состояние генератора
TEST_F(SquidGeneratorTest, SquidTestInitialState)
{
    auto generator = makeGenerator("node", { 1 });

    EXPECT_EQ(0U, generator->lastTimestamp());
    EXPECT_EQ(0U, generator->counter());
    EXPECT_EQ(0U, clock->calls());
}

// Нулевая временная метка совпадает с начальным значением и увеличивает счетчик
TEST_F(SquidGeneratorTest, SquidTestEpochTimestamp)
{
    auto generator = makeGenerator("node", { 0, 0 });

    EXPECT_EQ("node-0-0001", generator->generate());
    EXPECT_EQ("node-0-0002", generator->generate());
}

// Явный идентификатор машины попадает в идентификатор без изменений
TEST_F(SquidGeneratorTest, SquidTestExplicitMachineIdVerbatim)
{
    const std::vector<std::string> machineIds = { "AAAA", "", "with-dashes-inside",
                                                  "пробел и юникод", FALLBACK_MACHINE_ID };

    for (const auto &machineId : machineIds) {
        auto generator = makeGenerator(machineId, { 123456 });
        const auto id = generator->generate();

        EXPECT_EQ(machineId, generator->machineId());
        EXPECT_EQ(machineId + "-123456-0000", id);
        EXPECT_EQ(machineId, parseId(id).machineId);
    }
    // Источник идентификатора не используется, если идентификатор передан явно
    EXPECT_EQ(0U, provider.calls());
}

// Без явного идентификатора используется значение источника
TEST_F(SquidGeneratorTest, SquidTestMachineIdFromProvider)
{
    SquidGenerator generator(std::nullopt, provider,
                             std::make_shared<ScriptedClock>(std::deque<int64_t> { 77 }));

    EXPECT_EQ(1U, provider.calls());
    EXPECT_EQ("provider-machine", generator.machineId());
    EXPECT_EQ("provider-machine-77-0000", generator.generate());
    // Источник опрашивается только при создании
    generator.generate();
    EXPECT_EQ(1U, provider.calls());
}

// При ошибке источника используется идентификатор по умолчанию
TEST_F(SquidGeneratorTest, SquidTestFallbackMachineId)
{
    FixedMachineIdProvider failingProvider(std::nullopt);
    SquidGenerator generator(std::nullopt, failingProvider,
                             std::make_shared<ScriptedClock>(std::deque<int64_t> { 1 }));

    EXPECT_EQ("00000000-0000-0000-0000-000000000000", generator.machineId());
    EXPECT_EQ("00000000-0000-0000-0000-000000000000-1-0000", generator.generate());
}

// Проверка формата идентификаторов с системными часами
TEST_F(SquidGeneratorTest, SquidTestFormatting)
{
    SquidGenerator generator("machine");
    static const std::regex idRegex(R"(^machine-[0-9]+-[0-9]{4,}$)");

    for (size_t i = 0; i < 100000; i++) {
        const auto id = generator.generate();
        ASSERT_TRUE(std::regex_match(id, idRegex)) << id;

        const auto parsed = parseId(id);
        EXPECT_EQ(std::to_string(generator.lastTimestamp()), parsed.timestamp);
        // Значения меньше 10000 дополняются нулями ровно до 4 цифр
        if (generator.counter() < 10000) {
            EXPECT_EQ(4U, parsed.counter.size());
        }
        EXPECT_EQ(generator.counter(), std::stoull(parsed.counter));
    }
}

// Проверка уникальности идентификаторов
TEST_F(SquidGeneratorTest, SquidTestUniqueness)
{
    constexpr size_t ID_COUNT = 1000000;
    SquidGenerator generator("machine");
    std::unordered_set<std::string> ids;
    ids.reserve(ID_COUNT);

    for (size_t i = 0; i < ID_COUNT; i++) {
        ASSERT_TRUE(ids.insert(generator.generate()).second) << "Повтор на итерации " << i;
    }

    EXPECT_EQ(ID_COUNT, ids.size());
}

// Пары (временная метка, счетчик) строго возрастают
TEST_F(SquidGeneratorTest, SquidTestMonotonicState)
{
    SquidGenerator generator("machine");
    generator.generate();
    auto previous = std::make_pair(generator.lastTimestamp(), generator.counter());

    for (size_t i = 0; i < 100000; i++) {
        generator.generate();
        const auto current = std::make_pair(generator.lastTimestamp(), generator.counter());
        ASSERT_LT(previous, current);
        previous = current;
    }
}

// Идентификаторы одной ширины упорядочены лексикографически
TEST_F(SquidGeneratorTest, SquidTestLexicographicOrder)
{
    auto generator = makeGenerator("node", { 1700000000000, 1700000000000, 1700000000001,
                                             1700000000002, 1700000000002, 1700000000009 });

    std::string previous = generator->generate();
    for (size_t i = 0; i < 5; i++) {
        const auto current = generator->generate();
        EXPECT_LT(previous, current);
        previous = current;
    }
}

// Работа через интерфейс IdGenerator
TEST_F(SquidGeneratorTest, SquidTestPolymorphicUse)
{
    std::unique_ptr<IdGenerator> generator = makeGenerator("poly", { 10, 10 });

    EXPECT_EQ("poly-10-0000", generator->generate());
    EXPECT_EQ("poly-10-0001", generator->generate());
}

// Время раньше эпохи Unix приводит к аварийному завершению
TEST_F(SquidGeneratorTest, SquidTestClockBeforeEpochIsFatal)
{
    auto generator = makeGenerator("node", { 100, -1 });

    EXPECT_EQ("node-100-0000", generator->generate());
    EXPECT_DEATH(generator->generate(), "раньше эпохи Unix: -1 мс");

    // Дочерний процесс завершился, состояние в текущем процессе не изменилось
    EXPECT_EQ(100U, generator->lastTimestamp());
    EXPECT_EQ(0U, generator->counter());
}
} // namespace squid::tests
