#pragma once

#include "domain/LedgerState.hpp"
#include <string>

namespace ledger::ports::output {

/**
 * @brief Интерфейс хранилища снапшотов леджера
 *
 * Output Port: сохраняет и загружает всё состояние леджера одним документом.
 */
class ISnapshotStore {
public:
    virtual ~ISnapshotStore() = default;

    /**
     * @brief Записать состояние, полностью заменив предыдущий снапшот
     *
     * @throws domain::PersistenceIoError если запись не удалась
     */
    virtual void save(const domain::LedgerState& state) = 0;

    /**
     * @brief Прочитать состояние
     *
     * @return Пустое состояние, если снапшота ещё нет
     * @throws domain::PersistenceDecodeError если документ повреждён
     * @throws domain::PersistenceIoError если снапшот не читается
     */
    virtual domain::LedgerState load() = 0;

    /**
     * @brief Есть ли сохранённый снапшот
     */
    virtual bool exists() const = 0;

    /**
     * @brief Где лежит снапшот (путь к файлу, имя и т.п.) - для логов и ошибок
     */
    virtual std::string location() const = 0;

    /**
     * @brief Удалить снапшот
     */
    virtual void clear() = 0;
};

} // namespace ledger::ports::output
